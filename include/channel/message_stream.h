///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file message_stream.h
 * @brief Bidirectional text message transport used by the subscription channel
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace XPlaneBridge {

/**
 * Text message stream. Send() may be called from any thread, Receive() from
 * one reader thread only. Close() may be called from any thread and wakes a
 * blocked Receive().
 */
class MessageStream {
public:
    virtual ~MessageStream() = default;

    /** @throws ConnectionClosed or NetworkError */
    virtual void Send(const std::string& text) = 0;

    /**
     * @return next complete text message, std::nullopt on timeout
     * @throws ConnectionClosed at end of stream or after Close()
     */
    virtual std::optional<std::string> Receive(std::chrono::milliseconds timeout) = 0;

    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
};

} // namespace XPlaneBridge
