///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file logger.h
 * @brief Logging system wrapper for X-Plane Bridge
 *
 * Provides named per-component loggers that share one set of sinks.
 * Based on spdlog.
 *
 * Features:
 * - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL)
 * - Console output (colored stdout)
 * - File output with automatic rotation
 * - Configurable via environment variables
 *
 * Environment Variables:
 * - XPLANE_BRIDGE_LOG_LEVEL   : Set minimum log level (trace|debug|info|warn|error|critical)
 * - XPLANE_BRIDGE_LOG_FILE    : Enable file logging (0|1, default: 1)
 * - XPLANE_BRIDGE_LOG_CONSOLE : Enable console logging (0|1, default: 1)
 *
 * Usage:
 * @code
 *   #include "logging/logger.h"
 *
 *   // In main initialization
 *   Logger::Initialize();
 *
 *   // One logger per component, handed over in the constructor
 *   auto log = Logger::Create("beacon");
 *   DiscoveryListener listener(config, log);
 *
 *   // Inside the component
 *   LOG_INFO(log, "Listening on port {}", port);
 *
 *   // On shutdown
 *   Logger::Shutdown();
 * @endcode
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>
#include <memory>

#include "spdlog/logger.h"

namespace XPlaneBridge {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

///////////////////////////////////////////////////////////////////////////////////////////////////
// Logger Class - Sink setup and logger factory
///////////////////////////////////////////////////////////////////////////////////////////////////

class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Sets up console and file sinks based on environment variables.
     * This should be called once at application startup.
     *
     * @return true if initialization succeeded, false otherwise
     */
    static bool Initialize();

    /**
     * @brief Shutdown the logging system
     *
     * Flushes all pending log messages and releases resources.
     * Loggers handed out by Create() keep working but no longer write anywhere.
     */
    static void Shutdown();

    /**
     * @brief Create a named logger for one component
     *
     * The logger shares the sinks set up by Initialize(). Before Initialize()
     * (or after Shutdown()) the returned logger has no sinks.
     *
     * @param component Name shown in every line written by this logger
     * @return Shared pointer to a new spdlog logger, never null
     */
    static LoggerPtr Create(const std::string& component);

    /**
     * @brief Flush all pending log messages
     */
    static void Flush();

    /**
     * @brief Check if logger is initialized
     */
    static bool IsInitialized();

private:
    // Helper to get log file path
    static std::string GetLogFilePath();

    // Helper to parse log level from environment variable
    static int GetLogLevelFromEnv();
};

} // namespace XPlaneBridge

///////////////////////////////////////////////////////////////////////////////////////////////////
// Convenience Macros for Logging
///////////////////////////////////////////////////////////////////////////////////////////////////

#if defined(NDEBUG)
    // In Release builds, TRACE and DEBUG are disabled
    #define LOG_TRACE(log, ...)    ((void)0)
    #define LOG_DEBUG(log, ...)    ((void)0)
#else
    // In Debug builds, all levels are available
    #define LOG_TRACE(log, ...)    do { if (log) (log)->trace(__VA_ARGS__); } while (0)
    #define LOG_DEBUG(log, ...)    do { if (log) (log)->debug(__VA_ARGS__); } while (0)
#endif

#define LOG_INFO(log, ...)         do { if (log) (log)->info(__VA_ARGS__); } while (0)
#define LOG_WARN(log, ...)         do { if (log) (log)->warn(__VA_ARGS__); } while (0)
#define LOG_ERROR(log, ...)        do { if (log) (log)->error(__VA_ARGS__); } while (0)
#define LOG_CRITICAL(log, ...)     do { if (log) (log)->critical(__VA_ARGS__); } while (0)

// Flush macro for critical sections
#define LOG_FLUSH()                ::XPlaneBridge::Logger::Flush()
