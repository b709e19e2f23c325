///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file websocket_client.h
 * @brief RFC 6455 WebSocket client for the simulator web API
 *
 * Features:
 * - HTTP Upgrade handshake with Sec-WebSocket-Accept verification
 * - Masked client frames (text, pong, close)
 * - Reassembly of fragmented messages
 * - Automatic pong reply to ping
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "channel/message_stream.h"
#include "logging/logger.h"
#include "net/socket.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace XPlaneBridge {

namespace ws_opcode {
constexpr uint8_t CONTINUATION = 0x0;
constexpr uint8_t TEXT = 0x1;
constexpr uint8_t BINARY = 0x2;
constexpr uint8_t CLOSE = 0x8;
constexpr uint8_t PING = 0x9;
constexpr uint8_t PONG = 0xA;
}

struct WebSocketFrame {
    bool fin = true;
    uint8_t opcode = ws_opcode::TEXT;
    std::string payload;
};

class WebSocketClient : public MessageStream {
private:
    Socket sock;
    LoggerPtr log;
    std::string rx_buffer;                  ///< Bytes received but not yet framed
    std::string fragments;                  ///< Partial message while FIN is not set
    uint8_t fragment_opcode = 0;
    std::atomic<bool> open{false};
    std::mutex send_mutex;
    std::mt19937 rng;

    void Handshake(const std::string& host, uint16_t port, const std::string& path,
                   std::chrono::milliseconds timeout);
    void SendFrame(uint8_t opcode, const std::string& payload);

public:
    explicit WebSocketClient(LoggerPtr log);
    ~WebSocketClient() override;

    /**
     * @brief Connects and performs the upgrade handshake.
     * @throws NetworkError if the TCP connection fails
     * @throws HandshakeError if the server refuses the upgrade
     */
    void Open(const std::string& host, uint16_t port, const std::string& path,
              std::chrono::milliseconds timeout);

    void Send(const std::string& text) override;
    std::optional<std::string> Receive(std::chrono::milliseconds timeout) override;
    void Close() override;
    bool IsOpen() const override { return open.load(); }

    /**
     * @brief Encodes one frame.
     * @param mask_key client frames must be masked, server frames pass nullptr
     */
    static std::string EncodeFrame(const std::string& payload, uint8_t opcode, bool fin,
                                   const uint8_t* mask_key);

    /**
     * @brief Removes one complete frame from the front of buffer.
     * @return false if the buffer does not hold a complete frame yet
     */
    static bool DecodeFrame(std::string& buffer, WebSocketFrame& out);
};

} // namespace XPlaneBridge
