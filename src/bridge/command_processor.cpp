///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file command_processor.cpp
 * @brief Action table, JSON command parsing and dispatch
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "bridge/command_processor.h"

namespace XPlaneBridge {

using json = nlohmann::json;

namespace {

struct InstructionDescriber {
    std::string operator()(const CommandOnce& i) const {
        return "once " + i.command + (i.duration ? " (" + std::to_string(*i.duration) + " s)" : "");
    }
    std::string operator()(const CommandBegin& i) const { return "begin " + i.command; }
    std::string operator()(const CommandEnd& i) const { return "end " + i.command; }
    std::string operator()(const SetDataref& i) const { return "set " + i.path + "=" + i.value.dump(); }
    std::string operator()(const Macro& m) const {
        std::string text = "macro(";
        for (size_t n = 0; n < m.steps.size(); ++n) {
            if (n > 0) text += ", ";
            text += std::visit(*this, m.steps[n]);
        }
        return text + ")";
    }
};

struct InstructionSender {
    ICommandTarget& target;

    int64_t operator()(const CommandOnce& i) const {
        // A zero duration is a single press and release
        return target.ActivateCommand(i.command, true, i.duration.value_or(0.0));
    }
    int64_t operator()(const CommandBegin& i) const { return target.ActivateCommand(i.command, true, std::nullopt); }
    int64_t operator()(const CommandEnd& i) const { return target.ActivateCommand(i.command, false, std::nullopt); }
    int64_t operator()(const SetDataref& i) const { return target.SetVariable(i.path, i.value); }
    int64_t operator()(const Macro& m) const {
        int64_t last = -1;
        for (const auto& step : m.steps) {
            last = std::visit(*this, step);
            if (last < 0) return -1;
        }
        return last;
    }
};

// Narrows a parsed instruction to a single step; macros do not nest
struct StepOf {
    std::optional<Step> operator()(const Macro&) const { return std::nullopt; }
    template <typename T>
    std::optional<Step> operator()(const T& simple) const { return Step(simple); }
};

} // namespace

std::string Describe(const Instruction& instruction) {
    return std::visit(InstructionDescriber{}, instruction);
}

CommandProcessor::CommandProcessor(LoggerPtr log) : log(std::move(log)) {}

void CommandProcessor::InitializeDefaultActions() {
    // === LANDING GEAR AND FLAPS ===
    actions["gear_toggle"] = CommandOnce{"sim/flight_controls/landing_gear_toggle", std::nullopt};
    actions["gear_up"] = CommandOnce{"sim/flight_controls/landing_gear_up", std::nullopt};
    actions["gear_down"] = CommandOnce{"sim/flight_controls/landing_gear_down", std::nullopt};
    actions["flaps_up"] = CommandOnce{"sim/flight_controls/flaps_up", std::nullopt};
    actions["flaps_down"] = CommandOnce{"sim/flight_controls/flaps_down", std::nullopt};

    // === BRAKES ===
    actions["parking_brake_set"] = SetDataref{"sim/cockpit2/controls/parking_brake_ratio", 1.0};
    actions["parking_brake_release"] = SetDataref{"sim/cockpit2/controls/parking_brake_ratio", 0.0};
    actions["brakes_hold"] = CommandBegin{"sim/flight_controls/brakes_regular"};
    actions["brakes_release"] = CommandEnd{"sim/flight_controls/brakes_regular"};

    // === AUTOPILOT ===
    actions["ap_toggle"] = CommandOnce{"sim/autopilot/servos_toggle", std::nullopt};
    actions["ap_heading"] = CommandOnce{"sim/autopilot/heading", std::nullopt};
    actions["ap_altitude"] = CommandOnce{"sim/autopilot/altitude_hold", std::nullopt};

    // === SIMULATION ===
    actions["pause_toggle"] = CommandOnce{"sim/operation/pause_toggle", std::nullopt};
    actions["view_forward"] = CommandOnce{"sim/view/forward_with_2d_panel", std::nullopt};

    // === SEQUENCES ===
    actions["landing_config"] = Macro{{CommandOnce{"sim/flight_controls/landing_gear_down", std::nullopt},
                                       CommandOnce{"sim/flight_controls/flaps_down", std::nullopt},
                                       CommandOnce{"sim/lights/landing_lights_on", std::nullopt}}};
}

void CommandProcessor::RegisterAction(const std::string& name, Instruction instruction) {
    actions[name] = std::move(instruction);
}

std::optional<Instruction> CommandProcessor::ParseCommand(const std::string& command) const {
    json doc;
    try {
        doc = json::parse(command);
    } catch (const json::parse_error& e) {
        LOG_WARN(log, "invalid command JSON: {}", e.what());
        return std::nullopt;
    }
    if (!doc.is_object()) {
        LOG_WARN(log, "command is not an object: {}", command);
        return std::nullopt;
    }
    return ParseObject(doc, false);
}

std::optional<Instruction> CommandProcessor::ParseObject(const json& doc, bool nested) const {
    auto text_field = [&doc](const char* key) -> std::optional<std::string> {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) return std::nullopt;
        return it->get<std::string>();
    };

    auto macro = doc.find("macro");
    if (macro != doc.end()) {
        if (nested) {
            LOG_WARN(log, "macros cannot be nested");
            return std::nullopt;
        }
        if (!macro->is_array() || macro->empty()) {
            LOG_WARN(log, "macro needs a non-empty list of commands");
            return std::nullopt;
        }
        Macro m;
        for (const auto& item : *macro) {
            if (!item.is_object()) {
                LOG_WARN(log, "macro step is not an object: {}", item.dump());
                return std::nullopt;
            }
            auto parsed = ParseObject(item, true);
            if (!parsed) return std::nullopt;
            auto step = std::visit(StepOf{}, *parsed);
            if (!step) {
                LOG_WARN(log, "macro step {} is itself a macro", item.dump());
                return std::nullopt;
            }
            m.steps.push_back(std::move(*step));
        }
        return Instruction(std::move(m));
    }

    if (auto action = text_field("action")) {
        auto it = actions.find(*action);
        if (it == actions.end()) {
            LOG_WARN(log, "unknown action {}", *action);
            return std::nullopt;
        }
        return it->second;
    }

    if (auto name = text_field("command")) {
        const std::string phase = text_field("phase").value_or("once");
        if (phase == "begin") return Instruction(CommandBegin{*name});
        if (phase == "end") return Instruction(CommandEnd{*name});
        if (phase != "once") {
            LOG_WARN(log, "unknown phase {} for command {}", phase, *name);
            return std::nullopt;
        }
        CommandOnce once{*name, std::nullopt};
        auto d = doc.find("duration");
        if (d != doc.end() && d->is_number()) {
            const double seconds = d->get<double>();
            if (seconds < 0.0) {
                LOG_WARN(log, "negative duration for command {}", *name);
                return std::nullopt;
            }
            once.duration = seconds;
        }
        return Instruction(once);
    }

    auto path = text_field("dataref");
    if (!path) path = text_field("variable");
    if (path) {
        auto v = doc.find("value");
        if (v == doc.end() || v->is_null() || v->is_object()) {
            LOG_WARN(log, "dataref {} has no value to set", *path);
            return std::nullopt;
        }
        return Instruction(SetDataref{*path, *v});
    }

    LOG_WARN(log, "unrecognized command: {}", doc.dump());
    return std::nullopt;
}

int64_t CommandProcessor::Execute(const Instruction& instruction, ICommandTarget& target) const {
    const int64_t req_id = std::visit(InstructionSender{target}, instruction);
    if (req_id < 0) {
        LOG_WARN(log, "{} not sent", Describe(instruction));
    } else {
        LOG_DEBUG(log, "{} -> req. {}", Describe(instruction), req_id);
    }
    return req_id;
}

std::vector<int64_t> CommandProcessor::ProcessCommands(const std::vector<std::string>& commands,
                                                       ICommandTarget& target) const {
    std::vector<int64_t> sent;
    for (const auto& command : commands) {
        auto instruction = ParseCommand(command);
        if (!instruction) continue;
        const int64_t req_id = Execute(*instruction, target);
        if (req_id >= 0) sent.push_back(req_id);
    }
    return sent;
}

} // namespace XPlaneBridge
