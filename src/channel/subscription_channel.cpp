///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file subscription_channel.cpp
 * @brief Request sending, receive loop and update demultiplexing
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "channel/subscription_channel.h"

#include "channel/protocol.h"
#include "core/errors.h"
#include "net/ws_util.h"

#include <algorithm>
#include <cstdlib>
#include <type_traits>

namespace XPlaneBridge {

using json = nlohmann::json;

namespace {

int64_t ToInt(const json& v) {
    return v.is_number_integer() ? v.get<int64_t>() : static_cast<int64_t>(v.get<double>());
}

template <typename T>
std::vector<T> ToVector(const json& arr) {
    std::vector<T> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_number()) throw DecodeError("non numeric array element " + v.dump());
        if (std::is_same<T, int64_t>::value) {
            out.push_back(static_cast<T>(ToInt(v)));
        } else {
            out.push_back(static_cast<T>(v.get<double>()));
        }
    }
    return out;
}

// Writes values at the given indices of the array held by value, growing it as needed
template <typename T>
void SpreadValues(Value& value, const std::vector<int>& indices, const std::vector<T>& values) {
    std::vector<T> current;
    if (auto held = std::get_if<std::vector<T>>(&value)) current = *held;
    const int highest = *std::max_element(indices.begin(), indices.end());
    if (static_cast<int>(current.size()) <= highest) current.resize(highest + 1, T());
    for (size_t i = 0; i < indices.size(); ++i) current[indices[i]] = values[i];
    value = std::move(current);
}

// Whole array without subscribed indices, otherwise one value per index
bool ApplyArray(VariableEntry& entry, const json& raw, bool ints, const LoggerPtr& log) {
    if (entry.indices.empty()) {
        if (ints) entry.value = ToVector<int64_t>(raw);
        else entry.value = ToVector<double>(raw);
        return true;
    }
    const std::vector<int>* indices = &entry.indices;
    if (raw.size() != indices->size()) {
        LOG_WARN(log, "dataref array {}: size mismatch ({} values vs {} indices)",
                 entry.name, raw.size(), indices->size());
        // The server may still answer the subscription that preceded the last change
        if (entry.previous_indices.empty() || raw.size() != entry.previous_indices.size()) {
            LOG_WARN(log, "dataref array {}: no match with previously requested indices, update dropped", entry.name);
            return false;
        }
        LOG_WARN(log, "dataref array {}: using previously requested indices", entry.name);
        indices = &entry.previous_indices;
    }
    if (ints) SpreadValues(entry.value, *indices, ToVector<int64_t>(raw));
    else SpreadValues(entry.value, *indices, ToVector<double>(raw));
    return true;
}

} // namespace

bool ApplyRawValue(VariableEntry& entry, const json& raw, const LoggerPtr& log) {
    switch (entry.value_type) {
    case ValueType::Int:
        if (!raw.is_number()) break;
        entry.value = ToInt(raw);
        return true;

    case ValueType::Float:
    case ValueType::Double:
        if (!raw.is_number()) break;
        entry.value = raw.get<double>();
        return true;

    case ValueType::Data: {
        if (!raw.is_string()) break;
        std::string decoded;
        if (!ws_util::Base64Decode(raw.get<std::string>(), decoded)) {
            LOG_WARN(log, "{}: invalid base64 data", entry.name);
            return false;
        }
        decoded.erase(std::remove(decoded.begin(), decoded.end(), '\0'), decoded.end());
        entry.value = std::move(decoded);
        return true;
    }

    case ValueType::IntArray:
    case ValueType::FloatArray:
        if (!raw.is_array()) break;
        return ApplyArray(entry, raw, entry.value_type == ValueType::IntArray, log);

    case ValueType::Unknown:
        if (raw.is_boolean()) entry.value = raw.get<bool>();
        else if (raw.is_number_integer()) entry.value = raw.get<int64_t>();
        else if (raw.is_number()) entry.value = raw.get<double>();
        else if (raw.is_string()) entry.value = raw.get<std::string>();
        else if (raw.is_array()) return ApplyArray(entry, raw, false, log);
        else break;
        return true;
    }

    LOG_WARN(log, "{}: unexpected value {} for type {}", entry.name, raw.dump(), ToString(entry.value_type));
    return false;
}

SubscriptionChannel::SubscriptionChannel(std::shared_ptr<MessageStream> stream, VariableRegistry& registry,
                                         std::chrono::milliseconds poll_timeout, LoggerPtr log)
    : stream(std::move(stream)), registry(registry), poll_timeout(poll_timeout), log(std::move(log)) {}

SubscriptionChannel::~SubscriptionChannel() {
    Stop();
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Lifecycle
///////////////////////////////////////////////////////////////////////////////////////////////////

bool SubscriptionChannel::Start() {
    if (running || receiver.joinable()) {
        LOG_DEBUG(log, "channel already started");
        return false;
    }
    if (!stream->IsOpen()) {
        LOG_WARN(log, "cannot start channel: stream not open");
        return false;
    }
    stop_requested = false;
    running = true;
    receiver = std::thread(&SubscriptionChannel::ReceiveLoop, this);
    return true;
}

void SubscriptionChannel::Stop() {
    stop_requested = true;
    stream->Close();
    if (receiver.joinable()) {
        if (receiver.get_id() == std::this_thread::get_id()) {
            receiver.detach();  // Stop() from inside a callback
        } else {
            receiver.join();
        }
    }
    std::lock_guard<std::mutex> lock(pending_mutex);
    pending.clear();
}

void SubscriptionChannel::ReceiveLoop() {
    LOG_INFO(log, "channel receiver started");
    int idle = 0;
    while (!stop_requested) {
        try {
            auto message = stream->Receive(poll_timeout);
            if (!message) {
                if (++idle % 50 == 0) LOG_INFO(log, "waiting for data from simulator..");
                continue;
            }
            HandleMessage(*message);
        } catch (const ConnectionClosed& e) {
            if (!stop_requested) LOG_WARN(log, "stream closed: {}", e.what());
            break;
        } catch (const NetworkError& e) {
            LOG_ERROR(log, "receive failed: {}", e.what());
            break;
        } catch (const std::exception& e) {
            LOG_WARN(log, "message dropped: {}", e.what());
        }
    }

    stream->Close();
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        pending.clear();
    }
    running = false;
    LOG_INFO(log, "channel receiver terminated");

    if (!stop_requested && on_closed) {
        try {
            on_closed();
        } catch (const std::exception& e) {
            LOG_ERROR(log, "closed callback failed: {}", e.what());
        }
    }
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Outbound
///////////////////////////////////////////////////////////////////////////////////////////////////

int64_t SubscriptionChannel::Send(const json& request, RequestKind kind) {
    if (!stream->IsOpen()) {
        LOG_WARN(log, "not connected, {} not sent", request.value("type", std::string("request")));
        return -1;
    }
    std::lock_guard<std::mutex> send_lock(send_mutex);
    const int64_t req_id = next_req_id++;
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        pending[req_id] = kind;
    }
    const std::string text = protocol::Serialize(request, req_id);
    try {
        stream->Send(text);
    } catch (const BridgeError& e) {
        LOG_WARN(log, "req. {} not sent: {}", req_id, e.what());
        std::lock_guard<std::mutex> lock(pending_mutex);
        pending.erase(req_id);
        return -1;
    }
    LOG_DEBUG(log, ">> {}", text);
    return req_id;
}

int64_t SubscriptionChannel::SubscribeVariables(const std::vector<std::string>& paths, bool subscribe) {
    if (!stream->IsOpen()) {
        LOG_WARN(log, "not connected, {} not sent", subscribe ? "subscription" : "unsubscription");
        return -1;
    }
    std::map<int64_t, protocol::VariableRef> refs;
    for (const auto& path : paths) {
        auto parsed = ParseVariablePath(path);
        if (!parsed) {
            LOG_WARN(log, "invalid dataref path {}", path);
            continue;
        }
        auto entry = registry.ResolveVariable(parsed->first);
        if (!entry) continue;

        if (parsed->second && entry->Indexable()) {
            const int index = *parsed->second;
            const bool tracked = subscribe ? registry.AppendIndex(entry->name, index)
                                           : registry.RemoveIndex(entry->name, index);
            if (!tracked && !subscribe) continue;
            auto& ref = refs[entry->id];
            ref.id = entry->id;
            if (std::find(ref.indices.begin(), ref.indices.end(), index) == ref.indices.end()) {
                ref.indices.insert(std::lower_bound(ref.indices.begin(), ref.indices.end(), index), index);
            }
        } else {
            refs[entry->id].id = entry->id;
        }
    }
    if (refs.empty()) {
        LOG_WARN(log, "no dataref to {}", subscribe ? "subscribe" : "unsubscribe");
        return -1;
    }

    std::vector<protocol::VariableRef> list;
    for (auto& r : refs) list.push_back(std::move(r.second));
    return Send(protocol::VariableSubscription(list, subscribe),
                subscribe ? RequestKind::Subscribe : RequestKind::Unsubscribe);
}

int64_t SubscriptionChannel::SubscribeCommandNames(const std::vector<std::string>& names, bool subscribe) {
    if (!stream->IsOpen()) {
        LOG_WARN(log, "not connected, {} not sent", subscribe ? "subscription" : "unsubscription");
        return -1;
    }
    std::vector<int64_t> ids;
    for (const auto& name : names) {
        auto entry = registry.ResolveCommand(name);
        if (entry && std::find(ids.begin(), ids.end(), entry->id) == ids.end()) ids.push_back(entry->id);
    }
    if (ids.empty()) {
        LOG_WARN(log, "no command to {}", subscribe ? "subscribe" : "unsubscribe");
        return -1;
    }
    return Send(protocol::CommandSubscription(ids, subscribe),
                subscribe ? RequestKind::Subscribe : RequestKind::Unsubscribe);
}

int64_t SubscriptionChannel::SetVariable(const std::string& path, const json& value) {
    if (!stream->IsOpen()) {
        LOG_WARN(log, "not connected, dataref {} not set", path);
        return -1;
    }
    auto parsed = ParseVariablePath(path);
    if (!parsed) {
        LOG_WARN(log, "invalid dataref path {}", path);
        return -1;
    }
    auto entry = registry.ResolveVariable(parsed->first);
    if (!entry) return -1;
    if (!entry->writable) {
        LOG_WARN(log, "dataref {} is not writable", entry->name);
    }
    json out = value;
    if (entry->value_type == ValueType::Data && value.is_string()) {
        out = ws_util::Base64Encode(value.get<std::string>());
    }
    return Send(protocol::VariableWrite(entry->id, out, parsed->second));
}

int64_t SubscriptionChannel::ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration) {
    if (!stream->IsOpen()) {
        LOG_WARN(log, "not connected, command {} not sent", name);
        return -1;
    }
    auto entry = registry.ResolveCommand(name);
    if (!entry) return -1;
    return Send(protocol::CommandActivation(entry->id, is_active, duration));
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Inbound
///////////////////////////////////////////////////////////////////////////////////////////////////

void SubscriptionChannel::HandleMessage(const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    if (!message.is_object() || !message.contains("type") || !message["type"].is_string()) {
        throw DecodeError("message without type: " + text);
    }
    const std::string type = message["type"].get<std::string>();

    if (type == protocol::type::RESULT) {
        HandleResult(message);
        return;
    }
    if (type != protocol::type::DATAREF_UPDATE && type != protocol::type::COMMAND_UPDATE) {
        LOG_WARN(log, "invalid response type {}: {}", type, text);
        return;
    }
    auto data = message.find("data");
    if (data == message.end() || !data->is_object()) {
        LOG_WARN(log, "no data: {}", text);
        return;
    }
    if (type == protocol::type::DATAREF_UPDATE) {
        HandleVariableUpdates(*data);
    } else {
        HandleCommandUpdates(*data);
    }
}

void SubscriptionChannel::HandleResult(const json& message) {
    const protocol::Result result = protocol::ParseResult(message);
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        known = pending.erase(result.req_id) > 0;
    }
    if (!known) {
        LOG_DEBUG(log, "result for unknown req. {}", result.req_id);
    }
    if (result.success) {
        LOG_DEBUG(log, "req. {}: success", result.req_id);
    } else {
        LOG_WARN(log, "req. {}: failed {} ({})", result.req_id, result.error_message, result.error_code);
    }
}

void SubscriptionChannel::HandleVariableUpdates(const json& data) {
    for (auto it = data.begin(); it != data.end(); ++it) {
        char* end = nullptr;
        const int64_t id = std::strtoll(it.key().c_str(), &end, 10);
        if (end == it.key().c_str() || *end != '\0') {
            LOG_WARN(log, "invalid dataref id {}", it.key());
            continue;
        }
        const json& raw = it.value();
        std::optional<EntryUpdate> update;
        try {
            update = registry.UpdateVariable(id, [&](VariableEntry& entry) {
                return ApplyRawValue(entry, raw, log);
            });
        } catch (const std::exception& e) {
            // One bad value must not hide the others of the batch
            LOG_WARN(log, "dataref id {}: {}", id, e.what());
            continue;
        }
        if (update) {
            Deliver(*update);
        } else if (!registry.VariableById(id)) {
            LOG_DEBUG(log, "no dataref for id={} (late answer to an earlier request)", id);
        }
    }
}

void SubscriptionChannel::HandleCommandUpdates(const json& data) {
    for (auto it = data.begin(); it != data.end(); ++it) {
        char* end = nullptr;
        const int64_t id = std::strtoll(it.key().c_str(), &end, 10);
        if (end == it.key().c_str() || *end != '\0') {
            LOG_WARN(log, "invalid command id {}", it.key());
            continue;
        }
        const json& raw = it.value();
        bool active = false;
        if (raw.is_boolean()) active = raw.get<bool>();
        else if (raw.is_number()) active = raw.get<double>() != 0.0;
        else {
            LOG_WARN(log, "command id {}: unexpected state {}", id, raw.dump());
            continue;
        }
        auto update = registry.UpdateCommand(id, active);
        if (update) {
            Deliver(*update);
        } else {
            LOG_WARN(log, "no command for id={}", id);
        }
    }
}

void SubscriptionChannel::Deliver(const EntryUpdate& update) {
    LOG_TRACE(log, "{}={}", update.name, FormatValue(update.value));
    if (!on_update) return;
    try {
        on_update(update);
    } catch (const std::exception& e) {
        LOG_ERROR(log, "update callback failed for {}: {}", update.name, e.what());
    }
}

size_t SubscriptionChannel::PendingCount() const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return pending.size();
}

std::optional<RequestKind> SubscriptionChannel::PendingKind(int64_t req_id) const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    auto it = pending.find(req_id);
    if (it == pending.end()) return std::nullopt;
    return it->second;
}

} // namespace XPlaneBridge
