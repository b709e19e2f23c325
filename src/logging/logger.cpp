///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.cpp
 * @brief Implementation of the logging system for X-Plane Bridge
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "logging/logger.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/rotating_file_sink.h"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace XPlaneBridge {

namespace {

std::mutex g_sinks_mutex;
std::vector<spdlog::sink_ptr> g_sinks;
spdlog::level::level_enum g_level = spdlog::level::info;
bool g_initialized = false;

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Helper Functions
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string Logger::GetLogFilePath() {
    namespace fs = std::filesystem;

    fs::path log_dir;
    if (const char* state = GetEnv("XDG_STATE_HOME")) {
        log_dir = fs::path(state) / "xplane-bridge";
    } else if (const char* home = GetEnv("HOME")) {
        log_dir = fs::path(home) / ".local" / "state" / "xplane-bridge";
    }

    // Generate filename with current date: bridge_YYYYMMDD.log
    std::time_t now = std::time(nullptr);
    std::tm time_info;
    localtime_r(&now, &time_info);

    std::ostringstream filename;
    filename << "bridge_" << std::put_time(&time_info, "%Y%m%d") << ".log";

    if (!log_dir.empty()) {
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (!ec) {
            return (log_dir / filename.str()).string();
        }
    }

    // Fallback to current directory
    return filename.str();
}

int Logger::GetLogLevelFromEnv() {
    if (const char* raw = GetEnv("XPLANE_BRIDGE_LOG_LEVEL")) {
        std::string level(raw);

        // Convert to lowercase for comparison
        for (char& c : level) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (level == "trace")    return SPDLOG_LEVEL_TRACE;
        if (level == "debug")    return SPDLOG_LEVEL_DEBUG;
        if (level == "info")     return SPDLOG_LEVEL_INFO;
        if (level == "warn")     return SPDLOG_LEVEL_WARN;
        if (level == "error")    return SPDLOG_LEVEL_ERROR;
        if (level == "critical") return SPDLOG_LEVEL_CRITICAL;
    }

    // Default level: INFO in release, DEBUG in debug builds
    #if defined(NDEBUG)
        return SPDLOG_LEVEL_INFO;
    #else
        return SPDLOG_LEVEL_DEBUG;
    #endif
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Public Interface
///////////////////////////////////////////////////////////////////////////////////////////////////

bool Logger::Initialize() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    if (g_initialized) {
        return true;  // Already initialized
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        const char* enable_file = GetEnv("XPLANE_BRIDGE_LOG_FILE");
        const char* enable_console = GetEnv("XPLANE_BRIDGE_LOG_CONSOLE");

        bool use_file = (enable_file == nullptr) || (std::atoi(enable_file) != 0);           // Default: enabled
        bool use_console = (enable_console == nullptr) || (std::atoi(enable_console) != 0);  // Default: enabled

        if (use_console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] [thread %t] %v");
            sinks.push_back(console_sink);
        }

        // Add rotating file sink (5MB max, 3 files kept)
        if (use_file) {
            std::string log_file = GetLogFilePath();
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file,
                1024 * 1024 * 5,  // 5 MB max size
                3                 // Keep 3 rotated files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        g_sinks = std::move(sinks);
        g_level = static_cast<spdlog::level::level_enum>(GetLogLevelFromEnv());

        // Flush every 3 seconds
        spdlog::flush_every(std::chrono::seconds(3));

        g_initialized = true;
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Failed to initialize logging system: " << ex.what() << std::endl;
        g_sinks.clear();
        return false;
    }

    auto log = std::make_shared<spdlog::logger>("logging", g_sinks.begin(), g_sinks.end());
    log->set_level(g_level);
    LOG_INFO(log, "Logging system initialized successfully");
    LOG_DEBUG(log, "Log level: {}", spdlog::level::to_string_view(g_level));
    return true;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    if (!g_initialized) {
        return;
    }
    for (auto& sink : g_sinks) {
        sink->flush();
    }
    spdlog::shutdown();
    g_sinks.clear();
    g_initialized = false;
}

LoggerPtr Logger::Create(const std::string& component) {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    auto log = std::make_shared<spdlog::logger>(component, g_sinks.begin(), g_sinks.end());
    log->set_level(g_level);
    log->flush_on(spdlog::level::warn);  // Also flush on warnings and above
    // Registered loggers take part in the periodic flush
    if (g_initialized && !spdlog::get(component)) {
        spdlog::register_logger(log);
    }
    return log;
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    for (auto& sink : g_sinks) {
        sink->flush();
    }
}

bool Logger::IsInitialized() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    return g_initialized;
}

} // namespace XPlaneBridge
