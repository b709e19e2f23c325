///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file line_reader.cpp
 * @brief Buffered line reader over poll() and read()
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/line_reader.h"

#include "core/errors.h"
#include "net/socket.h"

#include <poll.h>
#include <unistd.h>

#include <cerrno>

namespace XPlaneBridge {

bool LineReader::TakeLine(std::string& line) {
    const size_t end = buffer.find('\n');
    if (end == std::string::npos) return false;
    line.assign(buffer, 0, end);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    buffer.erase(0, end + 1);
    return true;
}

LineReader::Status LineReader::Next(std::string& line, std::chrono::milliseconds timeout) {
    if (TakeLine(line)) return Status::Line;
    if (eof) {
        if (buffer.empty()) return Status::End;
        line.swap(buffer);
        buffer.clear();
        return Status::Line;
    }

    pollfd pfd{fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) return Status::Timeout;
        throw NetworkError(ErrnoText("poll()"));
    }
    if (ready == 0) return Status::Timeout;

    char chunk[4096];
    ssize_t n;
    do {
        n = ::read(fd, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);
    if (n < 0) throw NetworkError(ErrnoText("read()"));
    if (n == 0) {
        eof = true;
    } else {
        buffer.append(chunk, static_cast<size_t>(n));
    }

    // One read may carry many lines, or only part of one
    if (TakeLine(line)) return Status::Line;
    if (eof) return Next(line, timeout);
    return Status::Timeout;
}

} // namespace XPlaneBridge
