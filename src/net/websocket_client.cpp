///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file websocket_client.cpp
 * @brief WebSocket client implementation (handshake, framing, receive loop support)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/websocket_client.h"

#include "core/errors.h"
#include "net/http_client.h"
#include "net/ws_util.h"

#include <sys/socket.h>

#include <cctype>
#include <sstream>

namespace XPlaneBridge {

namespace {

constexpr size_t MAX_HANDSHAKE_BYTES = 16 * 1024;
constexpr uint64_t MAX_FRAME_BYTES = 1ULL << 31;

bool HeaderContains(const HttpResponse& resp, const std::string& name, const std::string& token) {
    auto it = resp.headers.find(name);
    if (it == resp.headers.end()) return false;
    std::string value = it->second;
    for (auto& c : value) c = (char)std::tolower((unsigned char)c);
    return value.find(token) != std::string::npos;
}

} // namespace

WebSocketClient::WebSocketClient(LoggerPtr log)
    : log(std::move(log)), rng(std::random_device{}()) {}

WebSocketClient::~WebSocketClient() {
    Close();
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Framing
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string WebSocketClient::EncodeFrame(const std::string& payload, uint8_t opcode, bool fin,
                                         const uint8_t* mask_key) {
    const size_t len = payload.size();
    std::string frame;
    frame.reserve(2 + 8 + 4 + len);
    frame.push_back((char)((fin ? 0x80 : 0x00) | (opcode & 0x0F)));
    const uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    if (len <= 125) {
        frame.push_back((char)(mask_bit | len));
    } else if (len <= 0xFFFF) {
        frame.push_back((char)(mask_bit | 126));
        frame.push_back((char)((len >> 8) & 0xFF));
        frame.push_back((char)(len & 0xFF));
    } else {
        frame.push_back((char)(mask_bit | 127));
        uint64_t l = (uint64_t)len;
        for (int i = 7; i >= 0; --i) frame.push_back((char)((l >> (i*8)) & 0xFF));
    }
    if (mask_key) {
        frame.append(reinterpret_cast<const char*>(mask_key), 4);
        for (size_t i = 0; i < len; ++i) {
            frame.push_back((char)((uint8_t)payload[i] ^ mask_key[i % 4]));
        }
    } else {
        frame.append(payload);
    }
    return frame;
}

bool WebSocketClient::DecodeFrame(std::string& buffer, WebSocketFrame& out) {
    if (buffer.size() < 2) return false;
    const uint8_t* p = reinterpret_cast<const uint8_t*>(buffer.data());
    const bool masked = (p[1] & 0x80) != 0;
    uint64_t len = (p[1] & 0x7F);
    size_t pos = 2;
    if (len == 126) {
        if (buffer.size() < pos + 2) return false;
        len = (uint64_t(p[pos]) << 8) | p[pos+1];
        pos += 2;
    } else if (len == 127) {
        if (buffer.size() < pos + 8) return false;
        len = 0;
        for (int i = 0; i < 8; ++i) len = (len << 8) | p[pos+i];
        pos += 8;
    }
    if (len > MAX_FRAME_BYTES) {
        throw DecodeError("websocket frame too large");
    }
    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer.size() < pos + 4) return false;
        for (int i = 0; i < 4; ++i) mask[i] = p[pos+i];
        pos += 4;
    }
    if (buffer.size() < pos + len) return false; // incomplete frame

    out.fin = (p[0] & 0x80) != 0;
    out.opcode = p[0] & 0x0F;
    out.payload.resize((size_t)len);
    for (size_t i = 0; i < (size_t)len; ++i) {
        uint8_t c = p[pos + i];
        if (masked) c ^= mask[i % 4];
        out.payload[i] = (char)c;
    }
    buffer.erase(0, pos + (size_t)len);
    return true;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Connection
///////////////////////////////////////////////////////////////////////////////////////////////////

void WebSocketClient::Open(const std::string& host, uint16_t port, const std::string& path,
                           std::chrono::milliseconds timeout) {
    sock = Socket::ConnectTcp(host, port, timeout);
    rx_buffer.clear();
    fragments.clear();
    Handshake(host, port, path, timeout);
    open = true;
    LOG_INFO(log, "WebSocket connected to ws://{}:{}{}", host, port, path);
}

void WebSocketClient::Handshake(const std::string& host, uint16_t port, const std::string& path,
                                std::chrono::milliseconds timeout) {
    uint8_t nonce[16];
    for (auto& b : nonce) b = (uint8_t)(rng() & 0xFF);
    const std::string key = ws_util::Base64Encode(nonce, sizeof(nonce));

    std::ostringstream req;
    req << "GET " << path << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n\r\n";
    sock.SendAll(req.str());

    // Read headers up to CRLF CRLF; anything after belongs to the first frames
    std::string raw;
    char buf[2048];
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (raw.find("\r\n\r\n") == std::string::npos) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0 || !sock.WaitReadable(left)) {
            throw HandshakeError("websocket handshake timed out");
        }
        size_t n = sock.Receive(buf, sizeof(buf));
        if (n == 0) throw HandshakeError("connection closed during websocket handshake");
        raw.append(buf, n);
        if (raw.size() > MAX_HANDSHAKE_BYTES) throw HandshakeError("websocket handshake response too large");
    }

    const size_t head_end = raw.find("\r\n\r\n") + 4;
    HttpResponse resp;
    if (!HttpClient::ParseResponse(raw.substr(0, head_end), resp)) {
        throw HandshakeError("invalid websocket handshake response");
    }
    if (resp.status != 101) {
        throw HandshakeError("websocket upgrade refused: " + std::to_string(resp.status) + " " + resp.reason);
    }
    if (!HeaderContains(resp, "upgrade", "websocket") || !HeaderContains(resp, "connection", "upgrade")) {
        throw HandshakeError("websocket upgrade headers missing");
    }
    auto accept = resp.headers.find("sec-websocket-accept");
    if (accept == resp.headers.end() || accept->second != ws_util::ComputeAcceptKey(key)) {
        throw HandshakeError("Sec-WebSocket-Accept mismatch");
    }
    rx_buffer = raw.substr(head_end);
}

void WebSocketClient::SendFrame(uint8_t opcode, const std::string& payload) {
    std::lock_guard<std::mutex> lock(send_mutex);
    uint8_t mask[4];
    for (auto& b : mask) b = (uint8_t)(rng() & 0xFF);
    sock.SendAll(EncodeFrame(payload, opcode, true, mask));
}

void WebSocketClient::Send(const std::string& text) {
    if (!open) throw ConnectionClosed();
    SendFrame(ws_opcode::TEXT, text);
}

std::optional<std::string> WebSocketClient::Receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[8192];
    for (;;) {
        if (!open) throw ConnectionClosed();

        WebSocketFrame frame;
        while (DecodeFrame(rx_buffer, frame)) {
            switch (frame.opcode) {
            case ws_opcode::CLOSE:
                LOG_INFO(log, "WebSocket closed by server");
                open = false;
                throw ConnectionClosed("closed by server");
            case ws_opcode::PING:
                SendFrame(ws_opcode::PONG, frame.payload);
                break;
            case ws_opcode::PONG:
                break;
            case ws_opcode::CONTINUATION:
                fragments.append(frame.payload);
                if (frame.fin && fragment_opcode == ws_opcode::TEXT) {
                    std::string message;
                    message.swap(fragments);
                    return message;
                }
                if (frame.fin) fragments.clear();  // binary messages are not used
                break;
            case ws_opcode::TEXT:
                if (frame.fin) return frame.payload;
                fragment_opcode = frame.opcode;
                fragments = frame.payload;
                break;
            default:
                fragment_opcode = frame.opcode;
                LOG_DEBUG(log, "Ignoring websocket frame with opcode {}", frame.opcode);
                break;
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0 || !sock.WaitReadable(left)) {
            return std::nullopt;
        }
        size_t n = sock.Receive(buf, sizeof(buf));
        if (n == 0) {
            open = false;
            throw ConnectionClosed("end of stream");
        }
        rx_buffer.append(buf, n);
    }
}

void WebSocketClient::Close() {
    if (open.exchange(false)) {
        try {
            SendFrame(ws_opcode::CLOSE, std::string("\x03\xE8", 2));  // 1000 normal closure
        } catch (const NetworkError& e) {
            LOG_DEBUG(log, "Close frame not sent: {}", e.what());
        }
    }
    if (sock.IsValid()) {
        // Wakes a reader blocked in poll(); the descriptor is released with the object
        ::shutdown(sock.Fd(), SHUT_RDWR);
    }
}

} // namespace XPlaneBridge
