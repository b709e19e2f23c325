///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file rest_directory.h
 * @brief Directory lookups through the X-Plane web API (REST)
 *
 * Endpoints used:
 *   GET /api/capabilities                          -> {"api":{"versions":[..]},"x-plane":{"version":..}}
 *   GET /api/<v>/datarefs?filter[name]=<name>      -> {"data":[{"id","name","value_type","is_writable"}]}
 *   GET /api/<v>/commands?filter[name]=<name>      -> {"data":[{"id","name","description"}]}
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "beacon/beacon_decoder.h"
#include "config/bridge_config.h"
#include "logging/logger.h"
#include "net/http_client.h"
#include "registry/directory.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace XPlaneBridge {

constexpr int32_t API_V1_MIN_VERSION = 121100;
constexpr int32_t API_V2_MIN_VERSION = 121400;

/** Where the web API of the current simulator session lives. */
struct ApiEndpoint {
    std::string host;
    uint16_t port = 0;
    std::string version;            ///< "v1", "v2", ...

    std::string RestPath() const { return "/api/" + version; }
    std::string WebSocketPath() const { return "/api/" + version; }
    std::string Url() const { return "http://" + host + ":" + std::to_string(port) + RestPath(); }
};

/**
 * @brief Derives the API endpoint from a beacon.
 * Same host: 127.0.0.1:8086, otherwise <beacon ip>:8080. Version v2 from
 * 12.1.4, v1 from 12.1.1. Configuration overrides win.
 * @param local_addresses addresses of this machine, see LocalIpv4Addresses()
 * @throws VersionNotSupported simulator too old for the web API and no override
 */
ApiEndpoint SelectEndpoint(const BeaconRecord& beacon, const BridgeConfig& config,
                           const std::vector<std::string>& local_addresses);

/** Highest "vN" in capabilities.api.versions, if any. */
std::optional<std::string> HighestApiVersion(const nlohmann::json& capabilities);

class RestDirectory : public IDirectory {
private:
    ApiEndpoint endpoint;
    HttpClient http;
    LoggerPtr log;

    std::optional<nlohmann::json> FindFirst(const std::string& collection, const std::string& name);

public:
    RestDirectory(const ApiEndpoint& endpoint, std::chrono::milliseconds timeout, LoggerPtr log);

    /** @return capabilities document, std::nullopt if the server does not provide it */
    std::optional<nlohmann::json> Capabilities();

    /**
     * @brief Switches to the highest version advertised by the server.
     * Keeps the current version when capabilities are not available.
     */
    void NegotiateVersion();

    const ApiEndpoint& Endpoint() const { return endpoint; }

    std::optional<VariableInfo> FindVariable(const std::string& name) override;
    std::optional<CommandInfo> FindCommand(const std::string& name) override;
};

} // namespace XPlaneBridge
