///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file variable_registry.h
 * @brief Session cache of dataref and command ids
 *
 * Names are resolved lazily through the bound directory and cached; a second
 * resolution of the same name returns the same entry without a lookup.
 * All entries are dropped by Reload() when a new simulator session starts.
 *
 * Thread safety: one mutex guards the whole cache. The name, id and type of an
 * entry never change once cached; values and indices are only changed through
 * the registry and should be read through the snapshot accessors.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "logging/logger.h"
#include "registry/directory.h"
#include "registry/entry.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace XPlaneBridge {

class VariableRegistry {
private:
    mutable std::mutex mutex;
    std::shared_ptr<IDirectory> directory;
    uint64_t generation = 0;   ///< Bumped by SetDirectory() and Reload()
    std::map<std::string, std::shared_ptr<VariableEntry>> variables;
    std::unordered_map<int64_t, std::shared_ptr<VariableEntry>> variables_by_id;
    std::map<std::string, std::shared_ptr<CommandEntry>> commands;
    std::unordered_map<int64_t, std::shared_ptr<CommandEntry>> commands_by_id;
    LoggerPtr log;

    /** Directory and cache generation, both read under the lock. */
    std::pair<std::shared_ptr<IDirectory>, uint64_t> BoundDirectory(const std::string& name) const;

public:
    explicit VariableRegistry(LoggerPtr log);

    /** Binds the lookup service of the current session (nullptr unbinds). */
    void SetDirectory(std::shared_ptr<IDirectory> dir);
    bool HasDirectory() const;

    /**
     * @brief Cached entry for name, looked up on first use.
     * @return nullptr if the simulator does not know the name, the lookup failed,
     *         or the session changed while the lookup was running
     * @throws NotConnected when no directory is bound
     */
    std::shared_ptr<VariableEntry> ResolveVariable(const std::string& name);
    std::shared_ptr<CommandEntry> ResolveCommand(const std::string& name);

    /** Cached entries only, no lookup. */
    std::shared_ptr<VariableEntry> VariableById(int64_t id) const;
    std::shared_ptr<CommandEntry> CommandById(int64_t id) const;

    /**
     * @brief Adds an index to the subscribed set of an array variable.
     * @return false if the variable is not cached or not an array
     */
    bool AppendIndex(const std::string& name, int index);

    /** @return false (and warns) if the index was not subscribed */
    bool RemoveIndex(const std::string& name, int index);

    std::vector<int> Indices(const std::string& name) const;

    /**
     * @brief Applies a change to a cached variable under the registry lock.
     * @param apply returns true if the entry changed
     * @return snapshot of the changed entry, std::nullopt if unknown id or unchanged
     */
    std::optional<EntryUpdate> UpdateVariable(int64_t id, const std::function<bool(VariableEntry&)>& apply);

    std::optional<EntryUpdate> UpdateCommand(int64_t id, bool is_active);

    /** Copies taken under the lock. */
    std::optional<VariableEntry> VariableSnapshot(const std::string& name) const;
    std::optional<CommandEntry> CommandSnapshot(const std::string& name) const;

    /** Drops all cached entries; ids must be resolved again. */
    void Reload();

    size_t VariableCount() const;
    size_t CommandCount() const;
};

} // namespace XPlaneBridge
