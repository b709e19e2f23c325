///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file command_processor.h
 * @brief Client command parsing and dispatch to the simulator
 *
 * Accepted JSON commands:
 *   {"command": "sim/flight_controls/flaps_down", "phase": "once|begin|end", "duration": 0.5}
 *   {"dataref": "sim/cockpit2/switches/panel_brightness_ratio[0]", "value": 0.8}
 *   {"variable": ..., "value": ...}        (same as "dataref")
 *   {"action": "gear_toggle"}             (looked up in the action table)
 *   {"macro": [{"command": ...}, {"dataref": ..., "value": ...}]}   (run in order)
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "logging/logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace XPlaneBridge {

/** Press and release; with a duration the simulator holds the command that long. */
struct CommandOnce {
    std::string command;
    std::optional<double> duration;
};

/** Start holding a command until the matching CommandEnd. */
struct CommandBegin {
    std::string command;
};

struct CommandEnd {
    std::string command;
};

/** Write a dataref; path may carry an index "name[3]". */
struct SetDataref {
    std::string path;
    nlohmann::json value;
};

/** A single request to the simulator. */
using Step = std::variant<CommandOnce, CommandBegin, CommandEnd, SetDataref>;

/** Steps sent one after the other; stops at the first step that is not sent. */
struct Macro {
    std::vector<Step> steps;
};

using Instruction = std::variant<CommandOnce, CommandBegin, CommandEnd, SetDataref, Macro>;

/** Printable form for logs, e.g. "begin sim/lights/landing_lights_on". */
std::string Describe(const Instruction& instruction);

/**
 * Receiver of instructions. Names are resolved to ids on the receiving side.
 * Both calls return the request id, -1 if nothing was sent.
 */
class ICommandTarget {
public:
    virtual ~ICommandTarget() = default;
    virtual int64_t ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration) = 0;
    virtual int64_t SetVariable(const std::string& path, const nlohmann::json& value) = 0;
};

class CommandProcessor {
private:
    std::unordered_map<std::string, Instruction> actions;   ///< Named shortcuts for {"action": name}
    LoggerPtr log;

    std::optional<Instruction> ParseObject(const nlohmann::json& doc, bool nested) const;

public:
    explicit CommandProcessor(LoggerPtr log);

    /** Fills the action table with common cockpit shortcuts. */
    void InitializeDefaultActions();

    /** Adds or replaces a named action. */
    void RegisterAction(const std::string& name, Instruction instruction);
    bool HasAction(const std::string& name) const { return actions.count(name) > 0; }
    size_t ActionCount() const { return actions.size(); }

    /**
     * @brief Parses one JSON client command.
     * @return instruction, std::nullopt (logged) if invalid or unknown
     */
    std::optional<Instruction> ParseCommand(const std::string& command) const;

    /** Sends one instruction. @return request id (the last one for a macro), -1 if not sent */
    int64_t Execute(const Instruction& instruction, ICommandTarget& target) const;

    /** Parses and executes a batch; returns the ids of the requests sent. */
    std::vector<int64_t> ProcessCommands(const std::vector<std::string>& commands, ICommandTarget& target) const;
};

} // namespace XPlaneBridge
