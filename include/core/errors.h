///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file errors.h
 * @brief Exception types raised by the X-Plane Bridge connectivity layer
 *
 * Transient conditions (no beacon, closed socket, undecodable message) are
 * caught by the background loops and never reach callers of Connect().
 * NotConnected is a programmer error and is raised synchronously.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <stdexcept>
#include <string>

namespace XPlaneBridge {

/** Base of all recoverable bridge errors. */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& what) : std::runtime_error(what) {}
};

/** No beacon observed within the discovery timeout. */
class IpNotFound : public BridgeError {
public:
    IpNotFound() : BridgeError("Could not find any running X-Plane instance in network") {}
    explicit IpNotFound(const std::string& what) : BridgeError(what) {}
};

/** Beacon found but its protocol version or application is not supported. */
class VersionNotSupported : public BridgeError {
public:
    explicit VersionNotSupported(const std::string& what) : BridgeError(what) {}
};

/** Discovery packet with a wrong magic header or truncated layout. */
class MalformedPacket : public BridgeError {
public:
    explicit MalformedPacket(const std::string& what) : BridgeError(what) {}
};

/** Inbound stream message that could not be decoded. */
class DecodeError : public BridgeError {
public:
    explicit DecodeError(const std::string& what) : BridgeError(what) {}
};

/** Socket level failure (resolve, connect, send, receive). */
class NetworkError : public BridgeError {
public:
    explicit NetworkError(const std::string& what) : BridgeError(what) {}
};

/** HTTP upgrade to WebSocket refused or invalid. */
class HandshakeError : public BridgeError {
public:
    explicit HandshakeError(const std::string& what) : BridgeError(what) {}
};

/** Peer closed the stream (end of stream or close frame). */
class ConnectionClosed : public BridgeError {
public:
    explicit ConnectionClosed(const std::string& what = "connection closed") : BridgeError(what) {}
};

/** Operation requires a live simulator session (e.g. resolving before connecting). */
class NotConnected : public std::logic_error {
public:
    explicit NotConnected(const std::string& what) : std::logic_error(what) {}
};

} // namespace XPlaneBridge
