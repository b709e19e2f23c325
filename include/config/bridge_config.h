///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file bridge_config.h
 * @brief Runtime configuration of the X-Plane Bridge
 *
 * Environment Variables (optional):
 *  - XPLANE_BRIDGE_MCAST_GROUP        : Beacon multicast group (default: 239.255.1.1)
 *  - XPLANE_BRIDGE_MCAST_PORT         : Beacon multicast port (default: 49707)
 *  - XPLANE_BRIDGE_BEACON_TIMEOUT_MS  : Wait for one beacon packet (default: 3000)
 *  - XPLANE_BRIDGE_RECONNECT_S        : Interval between discovery attempts (default: 10)
 *  - XPLANE_BRIDGE_WARN_EVERY         : Re-log "not found" every N attempts (default: 10)
 *  - XPLANE_BRIDGE_JOIN_TIMEOUT_S     : Bounded wait for loop threads on shutdown (default: 10)
 *  - XPLANE_BRIDGE_RECEIVE_POLL_MS    : Channel receive poll timeout (default: 500)
 *  - XPLANE_BRIDGE_CONNECT_TIMEOUT_MS : TCP connect / HTTP request timeout (default: 2000)
 *  - XPLANE_BRIDGE_API_HOST           : Web API host override (default: from beacon)
 *  - XPLANE_BRIDGE_API_PORT           : Web API port override (default: 8086 local, 8080 remote)
 *  - XPLANE_BRIDGE_API_VERSION        : Web API version override, e.g. v2 (default: from sim version)
 *  - XPLANE_BRIDGE_MIN_VERSION        : Lowest tested simulator version (default: 121100)
 *  - XPLANE_BRIDGE_MAX_VERSION        : Highest tested simulator version (default: 121399)
 *  - XPLANE_BRIDGE_TRANSPORT          : auto, webapi or udp (default: auto, UDP when there is no web API)
 *  - XPLANE_BRIDGE_UDP_FREQ           : RREF values per second over UDP, 1..100 (default: 1)
 *  - XPLANE_BRIDGE_UDP_MAX_DATAREFS   : RREF slots per UDP session (default: 80)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace XPlaneBridge {

constexpr const char* DEFAULT_MCAST_GROUP = "239.255.1.1";
constexpr uint16_t DEFAULT_MCAST_PORT = 49707;
constexpr uint16_t LOCAL_API_PORT = 8086;
constexpr uint16_t REMOTE_API_PORT = 8080;

struct BridgeConfig {
    // Discovery
    std::string mcast_group = DEFAULT_MCAST_GROUP;
    uint16_t mcast_port = DEFAULT_MCAST_PORT;
    bool bind_any = false;                                      ///< Bind INADDR_ANY instead of the group address
    std::chrono::milliseconds beacon_timeout{3000};

    // Supervisor
    std::chrono::milliseconds reconnect_interval{10000};
    int warn_every = 10;
    std::chrono::milliseconds join_timeout{10000};
    int32_t min_version = 121100;
    int32_t max_version = 121399;

    // Channel / web API
    std::chrono::milliseconds receive_poll{500};
    std::chrono::milliseconds connect_timeout{2000};
    std::string api_host;                                       ///< Empty: derived from beacon
    uint16_t api_port = 0;                                      ///< 0: derived from beacon
    std::string api_version;                                    ///< Empty: derived from simulator version

    // Transport
    std::string transport = "auto";                             ///< "auto", "webapi" or "udp"
    int udp_frequency = 1;
    int udp_max_datarefs = 80;

    /**
     * @brief Builds a configuration from XPLANE_BRIDGE_* environment variables.
     * Out of range values fall back to the defaults.
     */
    static BridgeConfig FromEnvironment();

    /** One-line description of the effective settings, for the startup log. */
    std::string Describe() const;
};

} // namespace XPlaneBridge
