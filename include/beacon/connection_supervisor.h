///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file connection_supervisor.h
 * @brief Discovery and reconnect loop for the simulator connection
 *
 * The supervisor runs one background thread that:
 *  - while searching, calls the beacon source every reconnect interval
 *  - once a beacon is accepted, reports connected and keeps calling the
 *    source at the same interval as a liveness check
 *  - reports a loss when the beacon disappears or a different simulator
 *    instance answers
 *
 * Observers are told about transitions through the connection callback.
 * Callbacks run on the loop thread.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "beacon/discovery_listener.h"
#include "config/bridge_config.h"
#include "logging/logger.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace XPlaneBridge {

enum class SupervisorState { Idle, Searching, Connected };

const char* ToString(SupervisorState state);

/** Connected flag plus the beacon that caused it (empty when disconnected). */
using ConnectionCallback = std::function<void(bool connected, const std::optional<BeaconRecord>& beacon)>;

/** Called after every successful liveness check while connected. */
using AliveCallback = std::function<void(const BeaconRecord& beacon)>;

class ConnectionSupervisor {
private:
    /**
     * Everything the loop thread touches. Shared with the thread so a loop
     * that outlives a timed-out join never reaches into a destroyed supervisor.
     */
    struct LoopContext {
        std::shared_ptr<IBeaconSource> source;
        BridgeConfig config;
        LoggerPtr log;
        ConnectionCallback on_connection;
        AliveCallback on_alive;

        std::mutex mutex;
        std::condition_variable wake;
        bool stop = false;                          ///< Guarded by mutex
        SupervisorState state = SupervisorState::Searching;   ///< Guarded by mutex
        std::optional<BeaconRecord> beacon;         ///< Guarded by mutex
        std::atomic<bool> connected{false};
        std::promise<void> finished;
    };

    std::shared_ptr<IBeaconSource> source;
    BridgeConfig config;
    LoggerPtr log;
    ConnectionCallback on_connection;
    AliveCallback on_alive;

    mutable std::mutex control_mutex;
    std::shared_ptr<LoopContext> context;           ///< Null while idle
    std::thread loop_thread;

    static void RunLoop(std::shared_ptr<LoopContext> ctx);
    static void CheckVersion(LoopContext& ctx, const BeaconRecord& beacon);
    static void Notify(LoopContext& ctx, bool connected, const std::optional<BeaconRecord>& beacon);

public:
    ConnectionSupervisor(std::shared_ptr<IBeaconSource> source, const BridgeConfig& config, LoggerPtr log);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /** Must be set before Connect(); later changes apply to the next loop. */
    void SetConnectionCallback(ConnectionCallback callback);
    void SetAliveCallback(AliveCallback callback);

    /**
     * @brief Starts the discovery loop.
     * @return false (and logs) if the loop is already running
     */
    bool Connect();

    /**
     * @brief Stops the loop and reports a disconnection if connected.
     * Waits for the loop thread up to the configured join timeout.
     */
    void Disconnect();

    /** Thread safe. */
    bool IsConnected() const;
    bool IsRunning() const;
    SupervisorState State() const;
    std::optional<BeaconRecord> Beacon() const;
};

} // namespace XPlaneBridge
