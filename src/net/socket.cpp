///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file socket.cpp
 * @brief POSIX socket wrapper implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/socket.h"

#include "core/errors.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace XPlaneBridge {

std::string ErrnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        Close();
        fd = other.Release();
    }
    return *this;
}

void Socket::Close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int Socket::Release() {
    int released = fd;
    fd = -1;
    return released;
}

Socket Socket::ConnectTcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw NetworkError("cannot resolve " + host + ": " + ::gai_strerror(rc));
    }

    Socket sock(::socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock.IsValid()) {
        ::freeaddrinfo(result);
        throw NetworkError(ErrnoText("socket()"));
    }

    // Non-blocking connect so the wait is bounded
    int flags = ::fcntl(sock.Fd(), F_GETFL, 0);
    ::fcntl(sock.Fd(), F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(sock.Fd(), result->ai_addr, result->ai_addrlen);
    ::freeaddrinfo(result);
    if (rc < 0 && errno != EINPROGRESS) {
        throw NetworkError(ErrnoText("connect(" + host + ":" + service + ")"));
    }
    if (rc < 0) {
        pollfd pfd{sock.Fd(), POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0) {
            throw NetworkError("connect(" + host + ":" + service + ") timed out");
        }
        if (ready < 0) {
            throw NetworkError(ErrnoText("poll()"));
        }
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(sock.Fd(), SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            throw NetworkError("connect(" + host + ":" + service + "): " + std::strerror(err));
        }
    }

    ::fcntl(sock.Fd(), F_SETFL, flags);
    int yes = 1;
    ::setsockopt(sock.Fd(), IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    ::setsockopt(sock.Fd(), SOL_SOCKET, SO_KEEPALIVE, &yes, sizeof(yes));
    return sock;
}

void Socket::SendAll(const void* data, size_t len) const {
    const char* p = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, p + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw NetworkError(ErrnoText("send()"));
        }
        sent += static_cast<size_t>(n);
    }
}

bool Socket::WaitReadable(std::chrono::milliseconds timeout) const {
    pollfd pfd{fd, POLLIN, 0};
    for (;;) {
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw NetworkError(ErrnoText("poll()"));
        }
        return ready > 0;
    }
}

size_t Socket::Receive(void* buffer, size_t len) const {
    for (;;) {
        ssize_t n = ::recv(fd, buffer, len, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw NetworkError(ErrnoText("recv()"));
        }
        return static_cast<size_t>(n);
    }
}

std::vector<std::string> LocalIpv4Addresses() {
    std::vector<std::string> out;
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        return out;
    }
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) continue;
        char text[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, text, sizeof(text)) != nullptr) {
            out.emplace_back(text);
        }
    }
    ::freeifaddrs(list);
    return out;
}

} // namespace XPlaneBridge
