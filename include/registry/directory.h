///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file directory.h
 * @brief Name to id lookup service of the simulator (one session)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "registry/entry.h"

#include <cstdint>
#include <optional>
#include <string>

namespace XPlaneBridge {

struct VariableInfo {
    int64_t id = 0;
    std::string name;
    ValueType value_type = ValueType::Unknown;
    bool writable = false;
};

struct CommandInfo {
    int64_t id = 0;
    std::string name;
    std::string description;
};

/**
 * Filter-by-name lookup. Implementations return std::nullopt when the name is
 * unknown and throw BridgeError subclasses on transport failures.
 */
class IDirectory {
public:
    virtual ~IDirectory() = default;
    virtual std::optional<VariableInfo> FindVariable(const std::string& name) = 0;
    virtual std::optional<CommandInfo> FindCommand(const std::string& name) = 0;
};

} // namespace XPlaneBridge
