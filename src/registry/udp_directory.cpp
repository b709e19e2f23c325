///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_directory.cpp
 * @brief Session local ids for UDP sessions
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "registry/udp_directory.h"

#include "channel/udp_protocol.h"

namespace XPlaneBridge {

std::optional<VariableInfo> UdpDirectory::FindVariable(const std::string& name) {
    if (name.empty() || name.size() >= udp::PATH_FIELD) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variable_ids.find(name);
    if (it == variable_ids.end()) {
        it = variable_ids.emplace(name, next_id++).first;
        variable_names[it->second] = name;
    }
    VariableInfo info;
    info.id = it->second;
    info.name = name;
    info.value_type = ValueType::Unknown;
    info.writable = true;
    return info;
}

std::optional<CommandInfo> UdpDirectory::FindCommand(const std::string& name) {
    if (name.empty() || name.size() >= udp::PATH_FIELD) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = command_ids.find(name);
    if (it == command_ids.end()) {
        it = command_ids.emplace(name, next_id++).first;
        command_names[it->second] = name;
    }
    CommandInfo info;
    info.id = it->second;
    info.name = name;
    return info;
}

std::optional<std::string> UdpDirectory::VariableName(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variable_names.find(id);
    if (it == variable_names.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> UdpDirectory::CommandName(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = command_names.find(id);
    if (it == command_names.end()) return std::nullopt;
    return it->second;
}

} // namespace XPlaneBridge
