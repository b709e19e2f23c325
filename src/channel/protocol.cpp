///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file protocol.cpp
 * @brief Request builders and result parsing
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "channel/protocol.h"

#include "core/errors.h"

namespace XPlaneBridge {
namespace protocol {

using json = nlohmann::json;

json VariableSubscription(const std::vector<VariableRef>& refs, bool subscribe) {
    json datarefs = json::array();
    for (const auto& ref : refs) {
        json item = {{"id", ref.id}};
        if (!ref.indices.empty()) item["index"] = ref.indices;
        datarefs.push_back(std::move(item));
    }
    return {{"type", subscribe ? type::DATAREF_SUBSCRIBE : type::DATAREF_UNSUBSCRIBE},
            {"params", {{"datarefs", std::move(datarefs)}}}};
}

json CommandSubscription(const std::vector<int64_t>& ids, bool subscribe) {
    json commands = json::array();
    for (int64_t id : ids) commands.push_back({{"id", id}});
    return {{"type", subscribe ? type::COMMAND_SUBSCRIBE : type::COMMAND_UNSUBSCRIBE},
            {"params", {{"commands", std::move(commands)}}}};
}

json CommandActivation(int64_t id, bool is_active, std::optional<double> duration) {
    json item = {{"id", id}, {"is_active", is_active}};
    if (duration) item["duration"] = *duration;
    return {{"type", type::COMMAND_SET}, {"params", {{"commands", json::array({item})}}}};
}

json VariableWrite(int64_t id, const json& value, std::optional<int> index) {
    json item = {{"id", id}, {"value", value}};
    if (index) item["index"] = *index;
    return {{"type", type::DATAREF_SET}, {"params", {{"datarefs", json::array({item})}}}};
}

std::string Serialize(json request, int64_t req_id) {
    request["req_id"] = req_id;
    return request.dump();
}

Result ParseResult(const json& message) {
    Result r;
    auto req = message.find("req_id");
    auto ok = message.find("success");
    if (req == message.end() || !req->is_number_integer() || ok == message.end() || !ok->is_boolean()) {
        throw DecodeError("result without req_id/success: " + message.dump());
    }
    r.req_id = req->get<int64_t>();
    r.success = ok->get<bool>();
    // error_code is a string in the documentation but numbers have been seen
    auto code = message.find("error_code");
    if (code != message.end() && !code->is_null()) {
        r.error_code = code->is_string() ? code->get<std::string>() : code->dump();
    }
    auto text = message.find("error_message");
    if (text != message.end() && text->is_string()) {
        r.error_message = text->get<std::string>();
    }
    return r;
}

} // namespace protocol
} // namespace XPlaneBridge
