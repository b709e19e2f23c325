///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file socket.h
 * @brief RAII wrapper around a POSIX socket descriptor plus a few helpers
 *        shared by the discovery listener, HTTP client and WebSocket client
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace XPlaneBridge {

/**
 * Owns one socket descriptor and closes it on destruction.
 * Move-only so a descriptor can never be closed twice.
 */
class Socket {
public:
    Socket() = default;
    explicit Socket(int descriptor) : fd(descriptor) {}
    ~Socket() { Close(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd(other.Release()) {}
    Socket& operator=(Socket&& other) noexcept;

    int Fd() const { return fd; }
    bool IsValid() const { return fd >= 0; }
    void Close();
    int Release();

    /**
     * @brief Opens a TCP connection with a bounded connect time.
     * Sets TCP_NODELAY and SO_KEEPALIVE like the rest of the bridge sockets.
     * @throws NetworkError on resolve, connect or timeout failure
     */
    static Socket ConnectTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    /**
     * @brief Sends the whole buffer, retrying on short writes and EINTR.
     * @throws NetworkError when the peer is gone
     */
    void SendAll(const void* data, size_t len) const;
    void SendAll(const std::string& data) const { SendAll(data.data(), data.size()); }

    /**
     * @brief Waits until the socket is readable.
     * @return true if readable (data or EOF), false on timeout
     */
    bool WaitReadable(std::chrono::milliseconds timeout) const;

    /**
     * @brief Reads what is available, blocking only if nothing is.
     * @return number of bytes read, 0 on orderly shutdown by the peer
     * @throws NetworkError on socket errors
     */
    size_t Receive(void* buffer, size_t len) const;

private:
    int fd = -1;
};

/** "what: strerror(errno)" for error messages. */
std::string ErrnoText(const std::string& what);

/** IPv4 addresses of all local interfaces, dotted form. */
std::vector<std::string> LocalIpv4Addresses();

} // namespace XPlaneBridge
