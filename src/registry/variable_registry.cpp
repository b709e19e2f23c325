///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file variable_registry.cpp
 * @brief Dataref / command id cache
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "registry/variable_registry.h"

#include "core/errors.h"

#include <algorithm>

namespace XPlaneBridge {

namespace {

template <typename Entry>
EntryUpdate MakeUpdate(const Entry& entry, EntryKind kind, Value value) {
    EntryUpdate u;
    u.kind = kind;
    u.name = entry.name;
    u.id = entry.id;
    u.value = std::move(value);
    return u;
}

} // namespace

VariableRegistry::VariableRegistry(LoggerPtr log) : log(std::move(log)) {}

void VariableRegistry::SetDirectory(std::shared_ptr<IDirectory> dir) {
    std::lock_guard<std::mutex> lock(mutex);
    directory = std::move(dir);
    ++generation;
}

bool VariableRegistry::HasDirectory() const {
    std::lock_guard<std::mutex> lock(mutex);
    return directory != nullptr;
}

std::pair<std::shared_ptr<IDirectory>, uint64_t> VariableRegistry::BoundDirectory(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!directory) {
        throw NotConnected("cannot resolve " + name + ": not connected to X-Plane");
    }
    return {directory, generation};
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Resolution
///////////////////////////////////////////////////////////////////////////////////////////////////

std::shared_ptr<VariableEntry> VariableRegistry::ResolveVariable(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = variables.find(name);
        if (it != variables.end()) return it->second;
    }

    // Lookup runs without the lock so value updates keep flowing
    auto bound = BoundDirectory(name);
    std::optional<VariableInfo> info;
    try {
        info = bound.first->FindVariable(name);
    } catch (const BridgeError& e) {
        LOG_ERROR(log, "dataref lookup {} failed: {}", name, e.what());
        return nullptr;
    }
    if (!info) {
        LOG_WARN(log, "dataref {} not found", name);
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (generation != bound.second) {
        LOG_DEBUG(log, "dataref {} -> id {} belongs to a previous session, dropped", name, info->id);
        return nullptr;
    }
    auto it = variables.find(name);
    if (it != variables.end()) return it->second;  // resolved concurrently

    auto entry = std::make_shared<VariableEntry>();
    entry->name = name;
    entry->id = info->id;
    entry->value_type = info->value_type;
    entry->writable = info->writable;
    variables[name] = entry;
    variables_by_id[entry->id] = entry;
    LOG_DEBUG(log, "dataref {} -> id {} ({})", name, entry->id, ToString(entry->value_type));
    return entry;
}

std::shared_ptr<CommandEntry> VariableRegistry::ResolveCommand(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = commands.find(name);
        if (it != commands.end()) return it->second;
    }

    auto bound = BoundDirectory(name);
    std::optional<CommandInfo> info;
    try {
        info = bound.first->FindCommand(name);
    } catch (const BridgeError& e) {
        LOG_ERROR(log, "command lookup {} failed: {}", name, e.what());
        return nullptr;
    }
    if (!info) {
        LOG_WARN(log, "command {} not found", name);
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (generation != bound.second) {
        LOG_DEBUG(log, "command {} -> id {} belongs to a previous session, dropped", name, info->id);
        return nullptr;
    }
    auto it = commands.find(name);
    if (it != commands.end()) return it->second;

    auto entry = std::make_shared<CommandEntry>();
    entry->name = name;
    entry->id = info->id;
    entry->description = info->description;
    commands[name] = entry;
    commands_by_id[entry->id] = entry;
    LOG_DEBUG(log, "command {} -> id {}", name, entry->id);
    return entry;
}

std::shared_ptr<VariableEntry> VariableRegistry::VariableById(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables_by_id.find(id);
    return it == variables_by_id.end() ? nullptr : it->second;
}

std::shared_ptr<CommandEntry> VariableRegistry::CommandById(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = commands_by_id.find(id);
    return it == commands_by_id.end() ? nullptr : it->second;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Array indices
///////////////////////////////////////////////////////////////////////////////////////////////////

bool VariableRegistry::AppendIndex(const std::string& name, int index) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables.find(name);
    if (it == variables.end() || !it->second->Indexable()) {
        LOG_WARN(log, "cannot add index {} to {}: not a cached array dataref", index, name);
        return false;
    }
    auto& indices = it->second->indices;
    auto pos = std::lower_bound(indices.begin(), indices.end(), index);
    if (pos != indices.end() && *pos == index) return true;
    it->second->previous_indices = indices;
    indices.insert(pos, index);
    return true;
}

bool VariableRegistry::RemoveIndex(const std::string& name, int index) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables.find(name);
    if (it == variables.end()) {
        LOG_WARN(log, "cannot remove index {} from {}: not cached", index, name);
        return false;
    }
    auto& indices = it->second->indices;
    auto pos = std::lower_bound(indices.begin(), indices.end(), index);
    if (pos == indices.end() || *pos != index) {
        LOG_WARN(log, "index {} of {} was not subscribed", index, name);
        return false;
    }
    it->second->previous_indices = indices;
    indices.erase(pos);
    return true;
}

std::vector<int> VariableRegistry::Indices(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables.find(name);
    return it == variables.end() ? std::vector<int>() : it->second->indices;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Values
///////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<EntryUpdate> VariableRegistry::UpdateVariable(int64_t id,
                                                            const std::function<bool(VariableEntry&)>& apply) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables_by_id.find(id);
    if (it == variables_by_id.end()) return std::nullopt;
    if (!apply(*it->second)) return std::nullopt;
    return MakeUpdate(*it->second, EntryKind::Variable, it->second->value);
}

std::optional<EntryUpdate> VariableRegistry::UpdateCommand(int64_t id, bool is_active) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = commands_by_id.find(id);
    if (it == commands_by_id.end()) return std::nullopt;
    it->second->is_active = is_active;
    return MakeUpdate(*it->second, EntryKind::Command, Value(is_active));
}

std::optional<VariableEntry> VariableRegistry::VariableSnapshot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = variables.find(name);
    if (it == variables.end()) return std::nullopt;
    return *it->second;
}

std::optional<CommandEntry> VariableRegistry::CommandSnapshot(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = commands.find(name);
    if (it == commands.end()) return std::nullopt;
    return *it->second;
}

void VariableRegistry::Reload() {
    std::lock_guard<std::mutex> lock(mutex);
    LOG_INFO(log, "reloading cache ({} datarefs, {} commands dropped)", variables.size(), commands.size());
    variables.clear();
    variables_by_id.clear();
    commands.clear();
    commands_by_id.clear();
    ++generation;
}

size_t VariableRegistry::VariableCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return variables.size();
}

size_t VariableRegistry::CommandCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return commands.size();
}

} // namespace XPlaneBridge
