///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file main.cpp
 * @brief xplane_bridge_cli - monitor datarefs and send commands from a terminal
 *
 * Usage:
 *   xplane_bridge_cli [dataref ...] [cmd:command ...]
 *
 * Every update of the given datarefs (or command active states, "cmd:" prefix)
 * is printed as name=value. JSON client commands are read from stdin, one per
 * line, e.g. {"command": "sim/operation/pause_toggle"}.
 * Stops on SIGINT, SIGTERM or end of input.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "beacon/discovery_listener.h"
#include "bridge/simulator_link.h"
#include "config/bridge_config.h"
#include "core/errors.h"
#include "logging/logger.h"
#include "net/line_reader.h"

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace XPlaneBridge;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void HandleSignal(int) {
    g_stop = 1;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [dataref ...] [cmd:command ...]\n"
              << "  dataref         dataref path, optionally indexed: sim/some/array[2]\n"
              << "  cmd:command     monitor the active state of a command\n"
              << "JSON commands are read from stdin, one per line.\n"
              << "Configuration: XPLANE_BRIDGE_* environment variables.\n";
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> variables;
    std::vector<std::string> commands;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        }
        if (arg.compare(0, 4, "cmd:") == 0) {
            if (arg.size() > 4) commands.push_back(arg.substr(4));
        } else {
            variables.push_back(arg);
        }
    }

    if (!Logger::Initialize()) {
        std::cerr << "Logging could not be initialized, continuing without file log" << std::endl;
    }
    auto log = Logger::Create("main");

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const BridgeConfig config = BridgeConfig::FromEnvironment();
    auto listener = std::make_shared<DiscoveryListener>(config, Logger::Create("beacon"));
    SimulatorLink link(config, listener, MakeSessionFactory(config, Logger::Create("session")), log);

    std::mutex out_mutex;
    link.SetUpdateCallback([&out_mutex](const EntryUpdate& update) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << (update.kind == EntryKind::Command ? "cmd:" : "") << update.name << "="
                  << FormatValue(update.value) << std::endl;
    });
    link.SetStatusCallback([&log](bool connected) {
        LOG_INFO(log, "X-Plane {}", connected ? "connected" : "disconnected");
    });

    if (!variables.empty()) link.MonitorVariables(variables);
    if (!commands.empty()) link.MonitorCommands(commands);
    link.Start();

    // stdin is polled so that a signal is noticed without waiting for input
    LineReader input(STDIN_FILENO);
    std::string line;
    while (!g_stop) {
        LineReader::Status status;
        try {
            status = input.Next(line, std::chrono::milliseconds(200));
        } catch (const NetworkError& e) {
            LOG_ERROR(log, "stdin: {}, stopping", e.what());
            break;
        }
        if (status == LineReader::Status::End) {
            LOG_INFO(log, "end of input");
            break;
        }
        if (status == LineReader::Status::Timeout || line.empty()) continue;
        if (link.ExecuteCommand(line) < 0) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "not sent: " << line << std::endl;
        }
    }

    LOG_INFO(log, "shutting down");
    link.Stop();
    Logger::Shutdown();
    return 0;
}
