///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file http_client.cpp
 * @brief HTTP/1.1 request/response handling over a plain TCP socket
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "net/http_client.h"

#include "core/errors.h"
#include "net/socket.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace XPlaneBridge {

namespace {

constexpr size_t MAX_RESPONSE_BYTES = 64 * 1024 * 1024;  // full dataref list is a few MB

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::string Trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\r')) --e;
    return s.substr(b, e - b);
}

// Decodes a chunked body. Returns false while more data is needed.
bool DecodeChunked(const std::string& raw, size_t pos, std::string& out) {
    out.clear();
    for (;;) {
        size_t line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) return false;
        std::string size_line = raw.substr(pos, line_end - pos);
        size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.resize(ext);
        char* end = nullptr;
        unsigned long chunk = std::strtoul(size_line.c_str(), &end, 16);
        if (end == size_line.c_str()) return false;
        pos = line_end + 2;
        if (chunk == 0) return true;
        if (raw.size() < pos + chunk + 2) return false;
        out.append(raw, pos, chunk);
        pos += chunk + 2;
    }
}

} // namespace

HttpClient::HttpClient(std::string host, uint16_t port, std::chrono::milliseconds timeout, LoggerPtr log)
    : host(std::move(host)), port(port), timeout(timeout), log(std::move(log)) {}

std::string HttpClient::UrlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool HttpClient::ParseResponse(const std::string& raw, HttpResponse& out) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return false;

    std::istringstream head(raw.substr(0, head_end));
    std::string status_line;
    std::getline(head, status_line);
    status_line = Trim(status_line);
    if (status_line.compare(0, 5, "HTTP/") != 0) return false;

    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return false;
    size_t sp2 = status_line.find(' ', sp1 + 1);
    out.status = std::atoi(status_line.substr(sp1 + 1, sp2 - sp1 - 1).c_str());
    out.reason = (sp2 == std::string::npos) ? std::string() : status_line.substr(sp2 + 1);
    if (out.status < 100 || out.status > 999) return false;

    out.headers.clear();
    std::string line;
    while (std::getline(head, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        out.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }

    const size_t body_start = head_end + 4;
    auto te = out.headers.find("transfer-encoding");
    if (te != out.headers.end() && ToLower(te->second).find("chunked") != std::string::npos) {
        return DecodeChunked(raw, body_start, out.body);
    }
    auto cl = out.headers.find("content-length");
    if (cl != out.headers.end()) {
        size_t length = std::strtoul(cl->second.c_str(), nullptr, 10);
        if (raw.size() < body_start + length) return false;
        out.body = raw.substr(body_start, length);
        return true;
    }
    // Close-delimited: everything received so far
    out.body = raw.substr(body_start);
    return true;
}

HttpResponse HttpClient::Request(const std::string& method, const std::string& target, const std::string& body) {
    Socket sock = Socket::ConnectTcp(host, port, timeout);

    std::ostringstream req;
    req << method << " " << target << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << port << "\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n";
    if (!body.empty()) {
        req << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n" << body;
    sock.SendAll(req.str());
    LOG_TRACE(log, "{} http://{}:{}{}", method, host, port, target);

    std::string raw;
    HttpResponse response;
    char buf[8192];
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0 || !sock.WaitReadable(left)) {
            throw NetworkError(method + " " + target + " timed out");
        }
        size_t n = sock.Receive(buf, sizeof(buf));
        if (n == 0) {
            // Peer closed: whatever we have must be complete now
            if (!ParseResponse(raw, response)) {
                throw NetworkError(method + " " + target + ": truncated response");
            }
            break;
        }
        raw.append(buf, n);
        if (raw.size() > MAX_RESPONSE_BYTES) {
            throw NetworkError(method + " " + target + ": response too large");
        }
        // Close-delimited bodies only finish at EOF
        bool delimited = raw.find("\r\n\r\n") != std::string::npos &&
                         (ToLower(raw.substr(0, raw.find("\r\n\r\n"))).find("content-length:") != std::string::npos ||
                          ToLower(raw.substr(0, raw.find("\r\n\r\n"))).find("chunked") != std::string::npos);
        if (delimited && ParseResponse(raw, response)) {
            break;
        }
    }

    LOG_DEBUG(log, "{} {} -> {} ({} bytes)", method, target, response.status, response.body.size());
    return response;
}

} // namespace XPlaneBridge
