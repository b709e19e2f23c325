///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file protocol.h
 * @brief JSON messages of the X-Plane web API WebSocket
 *
 * Outbound envelope: {"req_id": n, "type": "...", "params": {...}}
 * Inbound:
 *   {"type":"result","req_id":n,"success":bool,"error_code":"..","error_message":".."}
 *   {"type":"dataref_update_values","data":{"<id>": value, ...}}
 *   {"type":"command_update_is_active","data":{"<id>": bool, ...}}
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace XPlaneBridge {
namespace protocol {

namespace type {
constexpr const char* RESULT = "result";
constexpr const char* DATAREF_UPDATE = "dataref_update_values";
constexpr const char* COMMAND_UPDATE = "command_update_is_active";
constexpr const char* DATAREF_SUBSCRIBE = "dataref_subscribe_values";
constexpr const char* DATAREF_UNSUBSCRIBE = "dataref_unsubscribe_values";
constexpr const char* DATAREF_SET = "dataref_set_values";
constexpr const char* COMMAND_SUBSCRIBE = "command_subscribe_is_active";
constexpr const char* COMMAND_UNSUBSCRIBE = "command_unsubscribe_is_active";
constexpr const char* COMMAND_SET = "command_set_is_active";
}

/** One dataref in a (un)subscribe request; empty indices mean the whole array. */
struct VariableRef {
    int64_t id = 0;
    std::vector<int> indices;
};

nlohmann::json VariableSubscription(const std::vector<VariableRef>& refs, bool subscribe);
nlohmann::json CommandSubscription(const std::vector<int64_t>& ids, bool subscribe);

/** command_set_is_active; a duration makes the simulator release the command by itself. */
nlohmann::json CommandActivation(int64_t id, bool is_active, std::optional<double> duration = std::nullopt);

nlohmann::json VariableWrite(int64_t id, const nlohmann::json& value, std::optional<int> index = std::nullopt);

/** Adds req_id to a request built by one of the functions above. */
std::string Serialize(nlohmann::json request, int64_t req_id);

/** Acknowledgement of one request. */
struct Result {
    int64_t req_id = -1;
    bool success = false;
    std::string error_code;
    std::string error_message;
};

/** @throws DecodeError if the message lacks the result fields */
Result ParseResult(const nlohmann::json& message);

} // namespace protocol
} // namespace XPlaneBridge
