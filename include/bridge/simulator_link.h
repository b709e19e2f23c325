///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file simulator_link.h
 * @brief Keeps a subscription channel alive for as long as X-Plane is reachable
 *
 * The link ties the pieces together:
 *  - ConnectionSupervisor finds the simulator and reports transitions
 *  - on connect a new session is opened: directory bound to the registry,
 *    registry reloaded, stream opened, new channel, monitored names resubscribed
 *  - on loss the channel is stopped and dropped
 *  - on every liveness check a channel that closed on its own is reopened
 *
 * Monitored names are reference counted so that several consumers can ask
 * for the same dataref; the subscription is only removed with the last one.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "beacon/connection_supervisor.h"
#include "bridge/command_processor.h"
#include "channel/message_stream.h"
#include "channel/subscription_channel.h"
#include "config/bridge_config.h"
#include "logging/logger.h"
#include "registry/directory.h"
#include "registry/variable_registry.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace XPlaneBridge {

/** What one simulator session needs: id lookups and a message stream. */
struct Session {
    std::shared_ptr<IDirectory> directory;
    std::shared_ptr<MessageStream> stream;
    std::string description;
};

/**
 * Opens a session for a discovered simulator.
 * @throws BridgeError (VersionNotSupported, NetworkError, HandshakeError...) if it cannot
 */
using SessionFactory = std::function<Session(const BeaconRecord& beacon)>;

/** Web API session: REST directory plus WebSocket, endpoint derived from the beacon. */
SessionFactory MakeWebApiSessionFactory(const BridgeConfig& config, LoggerPtr log);

/** Legacy UDP session (RREF/DREF/CMND) with the port announced in the beacon. */
SessionFactory MakeUdpSessionFactory(const BridgeConfig& config, LoggerPtr log);

/**
 * @brief Session factory for config.transport.
 * "auto" tries the web API first and falls back to UDP when it cannot be used.
 */
SessionFactory MakeSessionFactory(const BridgeConfig& config, LoggerPtr log);

/** Same selection with explicit factories. */
SessionFactory MakeFallbackSessionFactory(SessionFactory primary, SessionFactory fallback, LoggerPtr log);

using StatusCallback = std::function<void(bool connected)>;

class SimulatorLink : public ICommandTarget {
private:
    BridgeConfig config;
    LoggerPtr log;
    LoggerPtr channel_log;
    VariableRegistry registry;
    ConnectionSupervisor supervisor;
    CommandProcessor processor;
    SessionFactory session_factory;

    mutable std::mutex mutex;
    std::shared_ptr<SubscriptionChannel> channel;         ///< Guarded by mutex
    std::map<std::string, int> monitored_variables;       ///< path -> reference count
    std::map<std::string, int> monitored_commands;
    UpdateCallback consumer;
    StatusCallback status_callback;
    std::atomic<int> sessions_opened{0};

    void OnConnection(bool connected, const std::optional<BeaconRecord>& beacon);
    void OnAlive(const BeaconRecord& beacon);
    void OpenSession(const BeaconRecord& beacon);
    void CloseSession();

    /** Counts names; returns those whose count went 0 -> 1 (add) or 1 -> 0 (remove). */
    static std::vector<std::string> Track(std::map<std::string, int>& counts, const std::vector<std::string>& names,
                                          bool add);

public:
    SimulatorLink(const BridgeConfig& config, std::shared_ptr<IBeaconSource> beacon_source,
                  SessionFactory session_factory, LoggerPtr log);
    ~SimulatorLink() override;

    /** Set before Start(). Receives every entry update (runs on the channel thread). */
    void SetUpdateCallback(UpdateCallback callback);
    void SetStatusCallback(StatusCallback callback);

    /** Starts discovery; returns false if already started. */
    bool Start();

    /** Stops discovery and closes the session. */
    void Stop();

    bool IsConnected() const;

    /**
     * @brief Adds consumers of dataref values ("name" or "name[index]").
     * Subscribes at once when connected, otherwise on the next session.
     */
    void MonitorVariables(const std::vector<std::string>& paths);
    void UnmonitorVariables(const std::vector<std::string>& paths);

    /** Same for command active state. */
    void MonitorCommands(const std::vector<std::string>& names);
    void UnmonitorCommands(const std::vector<std::string>& names);

    std::vector<std::string> MonitoredVariables() const;
    std::vector<std::string> MonitoredCommands() const;

    /** Parses and executes a JSON client command. @return request id, -1 if not sent */
    int64_t ExecuteCommand(const std::string& json_command);

    int64_t ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration) override;
    int64_t SetVariable(const std::string& path, const nlohmann::json& value) override;

    VariableRegistry& Registry() { return registry; }
    CommandProcessor& Processor() { return processor; }
    ConnectionSupervisor& Supervisor() { return supervisor; }

    /** Number of sessions opened since construction. */
    int SessionsOpened() const { return sessions_opened.load(); }

    /** Current channel, may be null. */
    std::shared_ptr<SubscriptionChannel> Channel() const;
};

} // namespace XPlaneBridge
