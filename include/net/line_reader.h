///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file line_reader.h
 * @brief Line-by-line reading from a descriptor (stdin, pipe) with a timeout
 *
 * Complete lines already buffered are returned before the descriptor is polled
 * again, so a burst of several lines is handed out at once. The descriptor is
 * not owned.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <string>

namespace XPlaneBridge {

class LineReader {
public:
    enum class Status { Line, Timeout, End };

    explicit LineReader(int fd) : fd(fd) {}

    /**
     * @brief Next line without its terminator ("\n" or "\r\n").
     * A last line without terminator is returned at end of input.
     * @return Line (line is set), Timeout, or End once the input is exhausted
     * @throws NetworkError if the descriptor cannot be read
     */
    Status Next(std::string& line, std::chrono::milliseconds timeout);

private:
    int fd;
    std::string buffer;
    bool eof = false;

    bool TakeLine(std::string& line);
};

} // namespace XPlaneBridge
