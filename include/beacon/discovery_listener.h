///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file discovery_listener.h
 * @brief Waits for one X-Plane beacon on the multicast group
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "beacon/beacon_decoder.h"
#include "config/bridge_config.h"
#include "logging/logger.h"

#include <chrono>

namespace XPlaneBridge {

/**
 * Source of beacon records. The supervisor only depends on this interface so
 * that tests can script discovery outcomes.
 */
class IBeaconSource {
public:
    virtual ~IBeaconSource() = default;

    /**
     * @brief Waits for one beacon.
     * @throws IpNotFound no (valid) packet within timeout
     * @throws VersionNotSupported beacon of an unsupported version
     */
    virtual BeaconRecord Discover(std::chrono::milliseconds timeout) = 0;
};

/**
 * Multicast beacon listener. Each Discover() call opens its own socket,
 * consults exactly one packet and closes the socket on every exit path.
 */
class DiscoveryListener : public IBeaconSource {
private:
    BridgeConfig config;
    LoggerPtr log;

public:
    DiscoveryListener(const BridgeConfig& config, LoggerPtr log);

    BeaconRecord Discover(std::chrono::milliseconds timeout) override;
};

} // namespace XPlaneBridge
