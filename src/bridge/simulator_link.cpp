///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file simulator_link.cpp
 * @brief Session management on top of the connection supervisor
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "bridge/simulator_link.h"

#include "channel/udp_protocol.h"
#include "channel/udp_stream.h"
#include "core/errors.h"
#include "net/socket.h"
#include "net/websocket_client.h"
#include "registry/rest_directory.h"
#include "registry/udp_directory.h"

namespace XPlaneBridge {

SessionFactory MakeWebApiSessionFactory(const BridgeConfig& config, LoggerPtr log) {
    return [config, log](const BeaconRecord& beacon) {
        ApiEndpoint endpoint = SelectEndpoint(beacon, config, LocalIpv4Addresses());
        auto directory = std::make_shared<RestDirectory>(endpoint, config.connect_timeout, log);
        if (config.api_version.empty()) {
            directory->NegotiateVersion();
            endpoint = directory->Endpoint();
        }
        auto stream = std::make_shared<WebSocketClient>(log);
        stream->Open(endpoint.host, endpoint.port, endpoint.WebSocketPath(), config.connect_timeout);
        LOG_INFO(log, "X-Plane API at {}", endpoint.Url());
        return Session{directory, stream, endpoint.Url()};
    };
}

SessionFactory MakeUdpSessionFactory(const BridgeConfig& config, LoggerPtr log) {
    return [config, log](const BeaconRecord& beacon) {
        const uint16_t port = beacon.port != 0 ? beacon.port : udp::DEFAULT_PORT;
        auto directory = std::make_shared<UdpDirectory>();
        auto stream = std::make_shared<UdpStream>(directory, config.udp_frequency,
                                                  static_cast<size_t>(config.udp_max_datarefs), log);
        stream->Open(beacon.ip, port);
        return Session{directory, stream, "udp://" + beacon.ip + ":" + std::to_string(port)};
    };
}

SessionFactory MakeFallbackSessionFactory(SessionFactory primary, SessionFactory fallback, LoggerPtr log) {
    return [primary, fallback, log](const BeaconRecord& beacon) {
        try {
            return primary(beacon);
        } catch (const VersionNotSupported& e) {
            LOG_INFO(log, "{}, using UDP", e.what());
        } catch (const BridgeError& e) {
            LOG_WARN(log, "web API not reachable ({}), using UDP", e.what());
        }
        return fallback(beacon);
    };
}

SessionFactory MakeSessionFactory(const BridgeConfig& config, LoggerPtr log) {
    if (config.transport == "webapi") return MakeWebApiSessionFactory(config, log);
    if (config.transport == "udp") return MakeUdpSessionFactory(config, log);
    return MakeFallbackSessionFactory(MakeWebApiSessionFactory(config, log), MakeUdpSessionFactory(config, log), log);
}

SimulatorLink::SimulatorLink(const BridgeConfig& config, std::shared_ptr<IBeaconSource> beacon_source,
                             SessionFactory session_factory, LoggerPtr log)
    : config(config),
      log(std::move(log)),
      channel_log(Logger::Create("channel")),
      registry(Logger::Create("registry")),
      supervisor(std::move(beacon_source), config, Logger::Create("supervisor")),
      processor(Logger::Create("commands")),
      session_factory(std::move(session_factory)) {
    processor.InitializeDefaultActions();
    supervisor.SetConnectionCallback([this](bool connected, const std::optional<BeaconRecord>& beacon) {
        OnConnection(connected, beacon);
    });
    supervisor.SetAliveCallback([this](const BeaconRecord& beacon) { OnAlive(beacon); });
}

SimulatorLink::~SimulatorLink() {
    Stop();
}

void SimulatorLink::SetUpdateCallback(UpdateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    consumer = std::move(callback);
}

void SimulatorLink::SetStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    status_callback = std::move(callback);
}

bool SimulatorLink::Start() {
    LOG_INFO(log, "starting X-Plane link ({})", config.Describe());
    return supervisor.Connect();
}

void SimulatorLink::Stop() {
    supervisor.Disconnect();
    CloseSession();
}

bool SimulatorLink::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex);
    return supervisor.IsConnected() && channel && channel->IsRunning();
}

std::shared_ptr<SubscriptionChannel> SimulatorLink::Channel() const {
    std::lock_guard<std::mutex> lock(mutex);
    return channel;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Sessions
///////////////////////////////////////////////////////////////////////////////////////////////////

void SimulatorLink::OnConnection(bool connected, const std::optional<BeaconRecord>& beacon) {
    if (connected && beacon) {
        OpenSession(*beacon);
    } else {
        CloseSession();
    }
    StatusCallback notify;
    {
        std::lock_guard<std::mutex> lock(mutex);
        notify = status_callback;
    }
    if (notify) notify(connected);
}

void SimulatorLink::OnAlive(const BeaconRecord& beacon) {
    auto current = Channel();
    if (current && current->IsRunning()) return;
    LOG_WARN(log, "channel is closed while X-Plane is still announced, reopening");
    OpenSession(beacon);
}

void SimulatorLink::OpenSession(const BeaconRecord& beacon) {
    CloseSession();

    Session session;
    try {
        session = session_factory(beacon);
    } catch (const BridgeError& e) {
        LOG_ERROR(log, "cannot open session with X-Plane at {}: {}", beacon.ip, e.what());
        return;
    }
    if (!session.directory || !session.stream) {
        LOG_ERROR(log, "incomplete session for X-Plane at {}", beacon.ip);
        return;
    }

    // New session: ids of the previous one are meaningless
    registry.SetDirectory(session.directory);
    registry.Reload();

    UpdateCallback forward;
    {
        std::lock_guard<std::mutex> lock(mutex);
        forward = consumer;
    }
    auto ch = std::make_shared<SubscriptionChannel>(session.stream, registry, config.receive_poll, channel_log);
    ch->SetUpdateCallback(forward);
    ch->SetClosedCallback([this]() { LOG_WARN(log, "session closed by X-Plane, waiting for next beacon"); });
    if (!ch->Start()) {
        LOG_ERROR(log, "cannot start channel for {}", session.description);
        registry.SetDirectory(nullptr);
        return;
    }

    std::vector<std::string> variables;
    std::vector<std::string> commands;
    {
        std::lock_guard<std::mutex> lock(mutex);
        channel = ch;
        for (const auto& v : monitored_variables) variables.push_back(v.first);
        for (const auto& c : monitored_commands) commands.push_back(c.first);
    }
    ++sessions_opened;
    LOG_INFO(log, "session {} opened ({}), resubscribing {} datarefs and {} commands", sessions_opened.load(),
             session.description, variables.size(), commands.size());

    if (!variables.empty()) ch->Subscribe(variables);
    if (!commands.empty()) ch->SubscribeCommands(commands);
}

void SimulatorLink::CloseSession() {
    std::shared_ptr<SubscriptionChannel> ch;
    {
        std::lock_guard<std::mutex> lock(mutex);
        ch.swap(channel);
    }
    if (!ch) return;
    ch->Stop();
    registry.SetDirectory(nullptr);
    LOG_INFO(log, "session closed");
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Monitoring
///////////////////////////////////////////////////////////////////////////////////////////////////

std::vector<std::string> SimulatorLink::Track(std::map<std::string, int>& counts,
                                              const std::vector<std::string>& names, bool add) {
    std::vector<std::string> changed;
    for (const auto& name : names) {
        if (add) {
            if (++counts[name] == 1) changed.push_back(name);
            continue;
        }
        auto it = counts.find(name);
        if (it == counts.end()) continue;
        if (--it->second == 0) {
            counts.erase(it);
            changed.push_back(name);
        }
    }
    return changed;
}

void SimulatorLink::MonitorVariables(const std::vector<std::string>& paths) {
    std::shared_ptr<SubscriptionChannel> ch;
    std::vector<std::string> added;
    {
        std::lock_guard<std::mutex> lock(mutex);
        added = Track(monitored_variables, paths, true);
        ch = channel;
    }
    if (!ch || added.empty()) return;
    try {
        ch->Subscribe(added);
    } catch (const NotConnected& e) {
        LOG_DEBUG(log, "session closed meanwhile: {}", e.what());
    }
}

void SimulatorLink::UnmonitorVariables(const std::vector<std::string>& paths) {
    std::shared_ptr<SubscriptionChannel> ch;
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        removed = Track(monitored_variables, paths, false);
        ch = channel;
    }
    if (!ch || removed.empty()) return;
    try {
        ch->Unsubscribe(removed);
    } catch (const NotConnected& e) {
        LOG_DEBUG(log, "session closed meanwhile: {}", e.what());
    }
}

void SimulatorLink::MonitorCommands(const std::vector<std::string>& names) {
    std::shared_ptr<SubscriptionChannel> ch;
    std::vector<std::string> added;
    {
        std::lock_guard<std::mutex> lock(mutex);
        added = Track(monitored_commands, names, true);
        ch = channel;
    }
    if (!ch || added.empty()) return;
    try {
        ch->SubscribeCommands(added);
    } catch (const NotConnected& e) {
        LOG_DEBUG(log, "session closed meanwhile: {}", e.what());
    }
}

void SimulatorLink::UnmonitorCommands(const std::vector<std::string>& names) {
    std::shared_ptr<SubscriptionChannel> ch;
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        removed = Track(monitored_commands, names, false);
        ch = channel;
    }
    if (!ch || removed.empty()) return;
    try {
        ch->UnsubscribeCommands(removed);
    } catch (const NotConnected& e) {
        LOG_DEBUG(log, "session closed meanwhile: {}", e.what());
    }
}

std::vector<std::string> SimulatorLink::MonitoredVariables() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    for (const auto& v : monitored_variables) out.push_back(v.first);
    return out;
}

std::vector<std::string> SimulatorLink::MonitoredCommands() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    for (const auto& c : monitored_commands) out.push_back(c.first);
    return out;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Commands
///////////////////////////////////////////////////////////////////////////////////////////////////

int64_t SimulatorLink::ExecuteCommand(const std::string& json_command) {
    auto instruction = processor.ParseCommand(json_command);
    if (!instruction) return -1;
    return processor.Execute(*instruction, *this);
}

int64_t SimulatorLink::ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration) {
    auto ch = Channel();
    if (!ch) {
        LOG_WARN(log, "not connected, command {} not sent", name);
        return -1;
    }
    try {
        return ch->ActivateCommand(name, is_active, duration);
    } catch (const NotConnected& e) {
        LOG_WARN(log, "command {} not sent: {}", name, e.what());
        return -1;
    }
}

int64_t SimulatorLink::SetVariable(const std::string& path, const nlohmann::json& value) {
    auto ch = Channel();
    if (!ch) {
        LOG_WARN(log, "not connected, dataref {} not set", path);
        return -1;
    }
    try {
        return ch->SetVariable(path, value);
    } catch (const NotConnected& e) {
        LOG_WARN(log, "dataref {} not set: {}", path, e.what());
        return -1;
    }
}

} // namespace XPlaneBridge
