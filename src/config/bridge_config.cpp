///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge_config.cpp
 * @brief Environment based configuration loader
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "config/bridge_config.h"

#include <arpa/inet.h>

#include <cstdlib>
#include <sstream>

namespace XPlaneBridge {

namespace {

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

// Reads an integer variable, keeping the fallback when unset, malformed or out of [lo, hi].
long ReadInt(const char* name, long fallback, long lo, long hi) {
    const char* raw = GetEnv(name);
    if (raw == nullptr) return fallback;
    char* end = nullptr;
    long v = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0') return fallback;
    if (v < lo || v > hi) return fallback;
    return v;
}

std::string ReadString(const char* name, const std::string& fallback) {
    const char* raw = GetEnv(name);
    return raw ? std::string(raw) : fallback;
}

} // namespace

BridgeConfig BridgeConfig::FromEnvironment() {
    BridgeConfig cfg;

    std::string group = ReadString("XPLANE_BRIDGE_MCAST_GROUP", cfg.mcast_group);
    in_addr parsed{};
    if (inet_pton(AF_INET, group.c_str(), &parsed) == 1) {
        cfg.mcast_group = group;
    }
    cfg.mcast_port = static_cast<uint16_t>(ReadInt("XPLANE_BRIDGE_MCAST_PORT", cfg.mcast_port, 1, 65535));
    cfg.beacon_timeout = std::chrono::milliseconds(
        ReadInt("XPLANE_BRIDGE_BEACON_TIMEOUT_MS", cfg.beacon_timeout.count(), 50, 60000));

    cfg.reconnect_interval = std::chrono::seconds(
        ReadInt("XPLANE_BRIDGE_RECONNECT_S", 10, 1, 3600));
    cfg.warn_every = static_cast<int>(ReadInt("XPLANE_BRIDGE_WARN_EVERY", cfg.warn_every, 1, 100000));
    cfg.join_timeout = std::chrono::seconds(
        ReadInt("XPLANE_BRIDGE_JOIN_TIMEOUT_S", 10, 1, 600));
    cfg.min_version = static_cast<int32_t>(ReadInt("XPLANE_BRIDGE_MIN_VERSION", cfg.min_version, 0, 9999999));
    cfg.max_version = static_cast<int32_t>(ReadInt("XPLANE_BRIDGE_MAX_VERSION", cfg.max_version, 0, 9999999));

    cfg.receive_poll = std::chrono::milliseconds(
        ReadInt("XPLANE_BRIDGE_RECEIVE_POLL_MS", cfg.receive_poll.count(), 10, 10000));
    cfg.connect_timeout = std::chrono::milliseconds(
        ReadInt("XPLANE_BRIDGE_CONNECT_TIMEOUT_MS", cfg.connect_timeout.count(), 100, 60000));
    cfg.api_host = ReadString("XPLANE_BRIDGE_API_HOST", cfg.api_host);
    cfg.api_port = static_cast<uint16_t>(ReadInt("XPLANE_BRIDGE_API_PORT", 0, 0, 65535));
    cfg.api_version = ReadString("XPLANE_BRIDGE_API_VERSION", cfg.api_version);

    std::string transport = ReadString("XPLANE_BRIDGE_TRANSPORT", cfg.transport);
    if (transport == "auto" || transport == "webapi" || transport == "udp") {
        cfg.transport = transport;
    }
    cfg.udp_frequency = static_cast<int>(ReadInt("XPLANE_BRIDGE_UDP_FREQ", cfg.udp_frequency, 1, 100));
    cfg.udp_max_datarefs = static_cast<int>(
        ReadInt("XPLANE_BRIDGE_UDP_MAX_DATAREFS", cfg.udp_max_datarefs, 1, 10000));

    return cfg;
}

std::string BridgeConfig::Describe() const {
    std::ostringstream out;
    out << "beacon " << mcast_group << ":" << mcast_port
        << " timeout " << beacon_timeout.count() << "ms"
        << ", reconnect every " << reconnect_interval.count() << "ms"
        << ", poll " << receive_poll.count() << "ms"
        << ", api " << (api_host.empty() ? "<beacon>" : api_host)
        << ":" << (api_port == 0 ? std::string("<auto>") : std::to_string(api_port))
        << " " << (api_version.empty() ? std::string("<auto>") : api_version)
        << ", versions " << min_version << ".." << max_version
        << ", transport " << transport << " (udp " << udp_frequency << "/s, " << udp_max_datarefs << " datarefs)";
    return out.str();
}

} // namespace XPlaneBridge
