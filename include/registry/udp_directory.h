///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_directory.h
 * @brief Local id assignment for UDP sessions
 *
 * The UDP interface addresses datarefs and commands by path, so there is no
 * remote lookup: every name gets a session local id on first use. Value types
 * are not reported over UDP, entries are Unknown and assumed writable.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "registry/directory.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace XPlaneBridge {

class UdpDirectory : public IDirectory {
private:
    mutable std::mutex mutex;
    int64_t next_id = 1;
    std::map<std::string, int64_t> variable_ids;
    std::map<int64_t, std::string> variable_names;
    std::map<std::string, int64_t> command_ids;
    std::map<int64_t, std::string> command_names;

public:
    /** @return std::nullopt if the path does not fit a UDP packet */
    std::optional<VariableInfo> FindVariable(const std::string& name) override;
    std::optional<CommandInfo> FindCommand(const std::string& name) override;

    std::optional<std::string> VariableName(int64_t id) const;
    std::optional<std::string> CommandName(int64_t id) const;
};

} // namespace XPlaneBridge
