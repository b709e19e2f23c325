///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file rest_directory.cpp
 * @brief REST lookups of dataref and command ids
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "registry/rest_directory.h"

#include "core/errors.h"

#include <algorithm>
#include <cstdlib>

namespace XPlaneBridge {

using json = nlohmann::json;

ApiEndpoint SelectEndpoint(const BeaconRecord& beacon, const BridgeConfig& config,
                           const std::vector<std::string>& local_addresses) {
    ApiEndpoint ep;
    const bool same_host = beacon.ip == "127.0.0.1" ||
        std::find(local_addresses.begin(), local_addresses.end(), beacon.ip) != local_addresses.end();
    // The API only listens on loopback (8086); remote access goes through 8080
    ep.host = same_host ? "127.0.0.1" : beacon.ip;
    ep.port = same_host ? LOCAL_API_PORT : REMOTE_API_PORT;
    if (!config.api_host.empty()) ep.host = config.api_host;
    if (config.api_port != 0) ep.port = config.api_port;

    if (!config.api_version.empty()) {
        ep.version = config.api_version;
    } else if (beacon.app_version >= API_V2_MIN_VERSION) {
        ep.version = "v2";
    } else if (beacon.app_version >= API_V1_MIN_VERSION) {
        ep.version = "v1";
    } else {
        throw VersionNotSupported("X-Plane " + std::to_string(beacon.app_version) + " has no web API");
    }
    return ep;
}

std::optional<std::string> HighestApiVersion(const json& capabilities) {
    if (!capabilities.is_object()) return std::nullopt;
    auto api = capabilities.find("api");
    if (api == capabilities.end() || !api->is_object()) return std::nullopt;
    auto versions = api->find("versions");
    if (versions == api->end() || !versions->is_array()) return std::nullopt;

    int best = -1;
    for (const auto& v : *versions) {
        if (!v.is_string()) continue;
        const std::string s = v.get<std::string>();
        if (s.size() < 2 || s[0] != 'v') continue;
        char* end = nullptr;
        long n = std::strtol(s.c_str() + 1, &end, 10);
        if (*end != '\0') continue;
        best = std::max(best, static_cast<int>(n));
    }
    if (best < 0) return std::nullopt;
    return "v" + std::to_string(best);
}

RestDirectory::RestDirectory(const ApiEndpoint& endpoint, std::chrono::milliseconds timeout, LoggerPtr log)
    : endpoint(endpoint), http(endpoint.host, endpoint.port, timeout, log), log(std::move(log)) {}

std::optional<json> RestDirectory::Capabilities() {
    HttpResponse resp = http.Get("/api/capabilities");
    if (!resp.Ok()) {
        LOG_INFO(log, "capabilities not available (HTTP {}), assuming {}", resp.status, endpoint.version);
        return std::nullopt;
    }
    try {
        return json::parse(resp.body);
    } catch (const json::exception& e) {
        LOG_WARN(log, "invalid capabilities document: {}", e.what());
        return std::nullopt;
    }
}

void RestDirectory::NegotiateVersion() {
    auto caps = Capabilities();
    if (!caps) return;
    auto best = HighestApiVersion(*caps);
    if (!best) {
        LOG_WARN(log, "no api version in capabilities, keeping {}", endpoint.version);
        return;
    }
    std::string xp = "?";
    auto it = caps->find("x-plane");
    if (it != caps->end() && it->is_object() && it->contains("version") && (*it)["version"].is_string()) {
        xp = (*it)["version"].get<std::string>();
    }
    if (*best != endpoint.version) {
        LOG_INFO(log, "selected latest api {} (was {}), X-Plane {}", *best, endpoint.version, xp);
        endpoint.version = *best;
    } else {
        LOG_INFO(log, "api {}, X-Plane {}", endpoint.version, xp);
    }
}

std::optional<json> RestDirectory::FindFirst(const std::string& collection, const std::string& name) {
    const std::string target = endpoint.RestPath() + "/" + collection + "?filter%5Bname%5D=" + HttpClient::UrlEncode(name);
    HttpResponse resp = http.Get(target);
    if (!resp.Ok()) {
        LOG_DEBUG(log, "{} lookup of {}: HTTP {}", collection, name, resp.status);
        return std::nullopt;
    }
    json doc;
    try {
        doc = json::parse(resp.body);
    } catch (const json::exception& e) {
        throw DecodeError(collection + " lookup of " + name + ": " + e.what());
    }
    auto data = doc.find("data");
    if (data == doc.end() || !data->is_array()) {
        throw DecodeError(collection + " lookup of " + name + ": no data array");
    }
    for (const auto& item : *data) {
        if (item.is_object() && item.contains("id") && item.contains("name") && item["name"].is_string() &&
            item["name"].get<std::string>() == name) {
            return item;
        }
    }
    return std::nullopt;
}

std::optional<VariableInfo> RestDirectory::FindVariable(const std::string& name) {
    auto item = FindFirst("datarefs", name);
    if (!item) return std::nullopt;
    try {
        VariableInfo info;
        info.id = (*item)["id"].get<int64_t>();
        info.name = name;
        info.value_type = ParseValueType(item->value("value_type", std::string()));
        info.writable = item->value("is_writable", false);
        return info;
    } catch (const json::exception& e) {
        throw DecodeError("dataref record for " + name + ": " + e.what());
    }
}

std::optional<CommandInfo> RestDirectory::FindCommand(const std::string& name) {
    auto item = FindFirst("commands", name);
    if (!item) return std::nullopt;
    try {
        CommandInfo info;
        info.id = (*item)["id"].get<int64_t>();
        info.name = name;
        info.description = item->value("description", std::string());
        return info;
    } catch (const json::exception& e) {
        throw DecodeError("command record for " + name + ": " + e.what());
    }
}

} // namespace XPlaneBridge
