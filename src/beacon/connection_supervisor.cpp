///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file connection_supervisor.cpp
 * @brief Discovery / reconnect state machine
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "beacon/connection_supervisor.h"

#include "core/errors.h"

namespace XPlaneBridge {

const char* ToString(SupervisorState state) {
    switch (state) {
    case SupervisorState::Idle: return "idle";
    case SupervisorState::Searching: return "searching";
    case SupervisorState::Connected: return "connected";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(std::shared_ptr<IBeaconSource> source, const BridgeConfig& config,
                                           LoggerPtr log)
    : source(std::move(source)), config(config), log(std::move(log)) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    Disconnect();
}

void ConnectionSupervisor::SetConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(control_mutex);
    on_connection = std::move(callback);
}

void ConnectionSupervisor::SetAliveCallback(AliveCallback callback) {
    std::lock_guard<std::mutex> lock(control_mutex);
    on_alive = std::move(callback);
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Control
///////////////////////////////////////////////////////////////////////////////////////////////////

bool ConnectionSupervisor::Connect() {
    std::lock_guard<std::mutex> lock(control_mutex);
    if (context) {
        LOG_DEBUG(log, "connect loop already started");
        return false;
    }

    auto ctx = std::make_shared<LoopContext>();
    ctx->source = source;
    ctx->config = config;
    ctx->log = log;
    ctx->on_connection = on_connection;
    ctx->on_alive = on_alive;

    context = ctx;
    loop_thread = std::thread(&ConnectionSupervisor::RunLoop, ctx);
    LOG_DEBUG(log, "connect loop started");
    return true;
}

void ConnectionSupervisor::Disconnect() {
    std::shared_ptr<LoopContext> ctx;
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(control_mutex);
        if (!context) {
            LOG_DEBUG(log, "not connected");
            return;
        }
        ctx = std::move(context);
        thread = std::move(loop_thread);
    }

    LOG_DEBUG(log, "disconnecting..");
    auto finished = ctx->finished.get_future();
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        ctx->stop = true;
    }
    ctx->wake.notify_all();

    if (finished.wait_for(ctx->config.join_timeout) == std::future_status::ready) {
        thread.join();
    } else {
        LOG_WARN(log, "connect loop did not stop within {} ms, detaching it",
                 ctx->config.join_timeout.count());
        thread.detach();
    }

    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        was_connected = ctx->state == SupervisorState::Connected;
        ctx->state = SupervisorState::Idle;
        ctx->beacon.reset();
        ctx->connected = false;
    }
    if (was_connected) {
        Notify(*ctx, false, std::nullopt);
    }
    LOG_INFO(log, "disconnected");
}

bool ConnectionSupervisor::IsConnected() const {
    std::lock_guard<std::mutex> lock(control_mutex);
    return context && context->connected.load();
}

bool ConnectionSupervisor::IsRunning() const {
    std::lock_guard<std::mutex> lock(control_mutex);
    return context != nullptr;
}

SupervisorState ConnectionSupervisor::State() const {
    std::lock_guard<std::mutex> lock(control_mutex);
    if (!context) return SupervisorState::Idle;
    std::lock_guard<std::mutex> ctx_lock(context->mutex);
    return context->state;
}

std::optional<BeaconRecord> ConnectionSupervisor::Beacon() const {
    std::lock_guard<std::mutex> lock(control_mutex);
    if (!context) return std::nullopt;
    std::lock_guard<std::mutex> ctx_lock(context->mutex);
    return context->beacon;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Loop
///////////////////////////////////////////////////////////////////////////////////////////////////

void ConnectionSupervisor::Notify(LoopContext& ctx, bool connected, const std::optional<BeaconRecord>& beacon) {
    if (!ctx.on_connection) return;
    try {
        ctx.on_connection(connected, beacon);
    } catch (const std::exception& e) {
        LOG_ERROR(ctx.log, "connection callback failed: {}", e.what());
    }
}

void ConnectionSupervisor::CheckVersion(LoopContext& ctx, const BeaconRecord& beacon) {
    const int32_t curr = beacon.app_version;
    if (curr < ctx.config.min_version) {
        LOG_WARN(ctx.log, "X-Plane version {} detected, minimal version is {}", curr, ctx.config.min_version);
        LOG_WARN(ctx.log, "Some features may not work properly");
    } else if (curr > ctx.config.max_version) {
        LOG_WARN(ctx.log, "X-Plane version {} detected, maximal version is {}", curr, ctx.config.max_version);
        LOG_WARN(ctx.log, "Some features may not work properly");
    } else {
        LOG_INFO(ctx.log, "X-Plane version meets current criteria ({} <= {} <= {})",
                 ctx.config.min_version, curr, ctx.config.max_version);
    }
}

void ConnectionSupervisor::RunLoop(std::shared_ptr<LoopContext> ctx) {
    LoopContext& c = *ctx;
    LOG_DEBUG(c.log, "starting..");
    int attempts = 0;

    // Beacon state is dropped on any failed attempt. Returns true if the loss must be
    // reported; once stopping, Disconnect() reports it and the owner may be gone.
    auto clear_beacon = [&c]() {
        std::lock_guard<std::mutex> lock(c.mutex);
        c.beacon.reset();
        c.connected = false;
        if (c.stop) return false;
        const bool was_connected = c.state == SupervisorState::Connected;
        c.state = SupervisorState::Searching;
        return was_connected;
    };

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(c.mutex);
            if (c.stop) break;
        }

        try {
            BeaconRecord rec = c.source->Discover(c.config.beacon_timeout);

            bool host_changed = false;
            bool newly_connected = false;
            {
                std::lock_guard<std::mutex> lock(c.mutex);
                if (c.stop) break;
                if (c.state == SupervisorState::Connected && c.beacon && !c.beacon->SameHost(rec)) {
                    host_changed = true;
                }
                newly_connected = c.state != SupervisorState::Connected || host_changed;
                c.beacon = rec;
                c.state = SupervisorState::Connected;
                c.connected = true;
            }

            if (host_changed) {
                LOG_WARN(c.log, "X-Plane moved to {}:{}, reconnecting", rec.ip, rec.port);
                Notify(c, false, std::nullopt);
            }
            if (newly_connected) {
                attempts = 0;
                CheckVersion(c, rec);
                LOG_INFO(c.log, "connected to X-Plane at {} ({})", rec.ip, rec.hostname);
                Notify(c, true, rec);
            } else {
                LOG_DEBUG(c.log, "..monitoring connection..");
                if (c.on_alive) {
                    try {
                        c.on_alive(rec);
                    } catch (const std::exception& e) {
                        LOG_ERROR(c.log, "alive callback failed: {}", e.what());
                    }
                }
            }
        } catch (const VersionNotSupported& e) {
            const bool was_connected = clear_beacon();
            LOG_ERROR(c.log, "X-Plane version not supported: {}", e.what());
            if (was_connected) Notify(c, false, std::nullopt);
        } catch (const IpNotFound& e) {
            const bool was_connected = clear_beacon();
            if (was_connected) {
                LOG_WARN(c.log, "X-Plane beacon lost, searching again");
                Notify(c, false, std::nullopt);
                attempts = 0;
            }
            if (c.config.warn_every <= 1 || attempts % c.config.warn_every == 0) {
                LOG_ERROR(c.log, "X-Plane instance not found on local network (attempt {})", attempts + 1);
            }
            ++attempts;
        } catch (const std::exception& e) {
            const bool was_connected = clear_beacon();
            LOG_ERROR(c.log, "discovery failed: {}", e.what());
            if (was_connected) Notify(c, false, std::nullopt);
        }

        std::unique_lock<std::mutex> lock(c.mutex);
        c.wake.wait_for(lock, c.config.reconnect_interval, [&c]() { return c.stop; });
        if (c.stop) break;
        LOG_DEBUG(c.log, c.state == SupervisorState::Connected ? "..monitoring.." : "..trying..");
    }

    LOG_DEBUG(c.log, "..ended");
    c.finished.set_value();
}

} // namespace XPlaneBridge
