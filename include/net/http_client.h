///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file http_client.h
 * @brief Minimal HTTP/1.1 client for the simulator web API (REST part)
 *
 * One connection per request ("Connection: close"). Bodies delimited by
 * Content-Length, chunked transfer encoding or connection close are supported.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "logging/logger.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace XPlaneBridge {

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  ///< Lower-case header names
    std::string body;

    bool Ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
private:
    std::string host;
    uint16_t port;
    std::chrono::milliseconds timeout;
    LoggerPtr log;

public:
    HttpClient(std::string host, uint16_t port, std::chrono::milliseconds timeout, LoggerPtr log);

    /**
     * @brief Performs one request and reads the full response.
     * @param method GET, POST, PATCH...
     * @param target Absolute path with optional query, e.g. /api/v2/datarefs?filter%5Bname%5D=x
     * @param body JSON body, sent with Content-Type application/json when not empty
     * @throws NetworkError on connect/transfer failure, timeout or unparsable response
     */
    HttpResponse Request(const std::string& method, const std::string& target, const std::string& body = "");

    HttpResponse Get(const std::string& target) { return Request("GET", target); }
    HttpResponse Patch(const std::string& target, const std::string& body) { return Request("PATCH", target, body); }

    const std::string& Host() const { return host; }
    uint16_t Port() const { return port; }

    /** Percent-encodes everything outside the RFC 3986 unreserved set, '/' included. */
    static std::string UrlEncode(const std::string& value);

    /**
     * @brief Parses a complete raw HTTP response (head and body).
     * @return false if the status line is invalid or the body is incomplete
     */
    static bool ParseResponse(const std::string& raw, HttpResponse& out);
};

} // namespace XPlaneBridge
