///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_command_processor.cpp
 * @brief Unit tests for CommandProcessor class
 *
 * Tests JSON command parsing and dispatch to a command target.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "bridge/command_processor.h"

#include <string>

using namespace XPlaneBridge;

TEST_CASE("Command JSON parsing", "[unit][command_processor]") {
    CommandProcessor processor(TestHelpers::TestLogger("commands"));

    SECTION("Command defaults to a single press") {
        auto instruction = processor.ParseCommand(R"({"command": "sim/operation/pause_toggle"})");
        REQUIRE(instruction.has_value());
        auto once = std::get_if<CommandOnce>(&*instruction);
        REQUIRE(once != nullptr);
        REQUIRE(once->command == "sim/operation/pause_toggle");
        REQUIRE_FALSE(once->duration.has_value());
    }

    SECTION("Press with duration") {
        auto instruction = processor.ParseCommand(R"({"command": "sim/flight_controls/flaps_down", "duration": 0.5})");
        REQUIRE(instruction.has_value());
        REQUIRE(std::get<CommandOnce>(*instruction).duration == 0.5);
    }

    SECTION("Begin and end phases") {
        auto begin = processor.ParseCommand(R"({"command": "sim/lights/landing_lights_on", "phase": "begin"})");
        auto end = processor.ParseCommand(R"({"command": "sim/lights/landing_lights_on", "phase": "end"})");
        REQUIRE(begin.has_value());
        REQUIRE(end.has_value());
        REQUIRE(std::holds_alternative<CommandBegin>(*begin));
        REQUIRE(std::holds_alternative<CommandEnd>(*end));
    }

    SECTION("Dataref write, with the variable alias") {
        auto set = processor.ParseCommand(R"({"dataref": "sim/cockpit2/controls/flap_ratio", "value": 0.75})");
        REQUIRE(set.has_value());
        REQUIRE(std::get<SetDataref>(*set).path == "sim/cockpit2/controls/flap_ratio");
        REQUIRE(std::get<SetDataref>(*set).value == 0.75);

        auto alias = processor.ParseCommand(R"({"variable": "sim/cockpit2/engine/actuators/throttle_ratio[0]", "value": [1, 2]})");
        REQUIRE(alias.has_value());
        REQUIRE(std::get<SetDataref>(*alias).value.is_array());
    }

    SECTION("Malformed JSON is rejected") {
        REQUIRE_FALSE(processor.ParseCommand("{invalid json}").has_value());
        REQUIRE_FALSE(processor.ParseCommand("[1, 2]").has_value());
    }

    SECTION("Missing or invalid fields are rejected") {
        REQUIRE_FALSE(processor.ParseCommand(R"({"dataref": "sim/cockpit2/controls/flap_ratio"})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"dataref": "sim/x", "value": null})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"dataref": "sim/x", "value": {"a": 1}})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"command": ""})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"command": "sim/x", "phase": "hold"})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"command": "sim/x", "duration": -1})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"value": 1})").has_value());
    }
}

TEST_CASE("Named actions", "[unit][command_processor]") {
    CommandProcessor processor(TestHelpers::TestLogger("commands"));

    SECTION("Unknown before the table is filled") {
        REQUIRE(processor.ActionCount() == 0);
        REQUIRE_FALSE(processor.ParseCommand(R"({"action": "gear_toggle"})").has_value());
    }

    processor.InitializeDefaultActions();

    SECTION("Default table") {
        REQUIRE(processor.HasAction("gear_toggle"));
        REQUIRE(processor.HasAction("parking_brake_set"));
        REQUIRE(processor.HasAction("pause_toggle"));
        auto gear = processor.ParseCommand(R"({"action": "gear_toggle"})");
        REQUIRE(gear.has_value());
        REQUIRE(std::get<CommandOnce>(*gear).command == "sim/flight_controls/landing_gear_toggle");
        REQUIRE_FALSE(processor.ParseCommand(R"({"action": "eject"})").has_value());
    }

    SECTION("Registered actions replace defaults") {
        const size_t before = processor.ActionCount();
        processor.RegisterAction("gear_toggle", CommandBegin{"sim/custom/gear"});
        processor.RegisterAction("beacon_on", SetDataref{"sim/cockpit/electrical/beacon_lights_on", 1});
        REQUIRE(processor.ActionCount() == before + 1);
        auto gear = processor.ParseCommand(R"({"action": "gear_toggle"})");
        REQUIRE(std::holds_alternative<CommandBegin>(*gear));
    }
}

TEST_CASE("Instructions are sent to the target", "[unit][command_processor]") {
    CommandProcessor processor(TestHelpers::TestLogger("commands"));
    processor.InitializeDefaultActions();
    TestHelpers::RecordingTarget target;

    SECTION("Single press carries a zero duration") {
        REQUIRE(processor.Execute(CommandOnce{"sim/operation/pause_toggle", std::nullopt}, target) == 1);
        REQUIRE(target.calls.size() == 1);
        REQUIRE(target.calls[0].is_active);
        REQUIRE(target.calls[0].duration == 0.0);
    }

    SECTION("Hold and release carry no duration") {
        processor.Execute(CommandBegin{"sim/flight_controls/brakes_regular"}, target);
        processor.Execute(CommandEnd{"sim/flight_controls/brakes_regular"}, target);
        REQUIRE(target.calls[0].is_active);
        REQUIRE_FALSE(target.calls[0].duration.has_value());
        REQUIRE_FALSE(target.calls[1].is_active);
        REQUIRE_FALSE(target.calls[1].duration.has_value());
    }

    SECTION("Batch of client commands") {
        auto ids = processor.ProcessCommands({
            R"({"action": "parking_brake_set"})",
            R"({"bogus": true})",
            R"({"command": "sim/flight_controls/flaps_down", "duration": 1.5})"
        }, target);
        REQUIRE(ids == std::vector<int64_t>{1, 2});
        REQUIRE(target.calls.size() == 2);
        REQUIRE(target.calls[0].is_write);
        REQUIRE(target.calls[0].name == "sim/cockpit2/controls/parking_brake_ratio");
        REQUIRE(target.calls[0].value == 1.0);
        REQUIRE(target.calls[1].duration == 1.5);
    }

    SECTION("Unsent instructions give -1") {
        class OfflineTarget : public ICommandTarget {
        public:
            int64_t ActivateCommand(const std::string&, bool, std::optional<double>) override { return -1; }
            int64_t SetVariable(const std::string&, const nlohmann::json&) override { return -1; }
        } offline;
        REQUIRE(processor.Execute(CommandOnce{"sim/operation/pause_toggle", std::nullopt}, offline) == -1);
        REQUIRE(processor.ProcessCommands({R"({"action": "gear_toggle"})"}, offline).empty());
    }
}

TEST_CASE("Macros run their steps in order", "[unit][command_processor]") {
    CommandProcessor processor(TestHelpers::TestLogger("commands"));
    processor.InitializeDefaultActions();
    TestHelpers::RecordingTarget target;

    SECTION("Default landing sequence") {
        auto landing = processor.ParseCommand(R"({"action": "landing_config"})");
        REQUIRE(landing.has_value());
        REQUIRE(std::get<Macro>(*landing).steps.size() == 3);
        REQUIRE(processor.Execute(*landing, target) == 3);
        REQUIRE(target.calls.size() == 3);
        REQUIRE(target.calls[0].name == "sim/flight_controls/landing_gear_down");
        REQUIRE(target.calls[1].name == "sim/flight_controls/flaps_down");
        REQUIRE(target.calls[2].name == "sim/lights/landing_lights_on");
    }

    SECTION("Macro from JSON") {
        auto macro = processor.ParseCommand(R"({"macro": [
            {"command": "sim/flight_controls/brakes_regular", "phase": "begin"},
            {"dataref": "sim/cockpit2/controls/parking_brake_ratio", "value": 1.0},
            {"action": "gear_down"}
        ]})");
        REQUIRE(macro.has_value());
        const auto& steps = std::get<Macro>(*macro).steps;
        REQUIRE(steps.size() == 3);
        REQUIRE(std::holds_alternative<CommandBegin>(steps[0]));
        REQUIRE(std::holds_alternative<SetDataref>(steps[1]));
        REQUIRE(std::get<CommandOnce>(steps[2]).command == "sim/flight_controls/landing_gear_down");

        REQUIRE(processor.Execute(*macro, target) == 3);
        REQUIRE(target.calls[1].is_write);
    }

    SECTION("Invalid macros") {
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": []})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": "gear_up"})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": [42]})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": [{"command": "sim/a"}, {"bogus": 1}]})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": [{"macro": [{"command": "sim/a"}]}]})").has_value());
        REQUIRE_FALSE(processor.ParseCommand(R"({"macro": [{"action": "landing_config"}]})").has_value());
    }

    SECTION("Stops at the first step not sent") {
        class FlakyTarget : public ICommandTarget {
        public:
            int sent = 0;
            int64_t ActivateCommand(const std::string& name, bool, std::optional<double>) override {
                if (name == "sim/flight_controls/flaps_down") return -1;
                return ++sent;
            }
            int64_t SetVariable(const std::string&, const nlohmann::json&) override { return ++sent; }
        } flaky;
        auto landing = processor.ParseCommand(R"({"action": "landing_config"})");
        REQUIRE(processor.Execute(*landing, flaky) == -1);
        REQUIRE(flaky.sent == 1);
    }
}

TEST_CASE("Instruction descriptions", "[unit][command_processor]") {
    REQUIRE(Describe(CommandBegin{"sim/lights/landing_lights_on"}) == "begin sim/lights/landing_lights_on");
    REQUIRE(Describe(CommandEnd{"sim/lights/landing_lights_on"}) == "end sim/lights/landing_lights_on");
    REQUIRE(TestHelpers::StringContains(Describe(SetDataref{"sim/x", 2}), "set sim/x=2"));
    REQUIRE(Describe(Macro{{CommandBegin{"sim/a"}, CommandEnd{"sim/a"}}}) == "macro(begin sim/a, end sim/a)");
}
