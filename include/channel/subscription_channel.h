///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file subscription_channel.h
 * @brief One WebSocket session with the simulator: requests out, updates in
 *
 * Features:
 * - Dataref value and command state (un)subscriptions, batched per request
 * - Dataref writes and command activation
 * - Background receive thread demultiplexing updates into the registry
 * - One update callback per changed entry, in wire order
 *
 * Request ids start at 1 for every channel and strictly increase.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "channel/message_stream.h"
#include "logging/logger.h"
#include "registry/variable_registry.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace XPlaneBridge {

enum class RequestKind { Subscribe, Unsubscribe, Other };

using UpdateCallback = std::function<void(const EntryUpdate& update)>;
using ClosedCallback = std::function<void()>;

class SubscriptionChannel {
private:
    std::shared_ptr<MessageStream> stream;
    VariableRegistry& registry;
    std::chrono::milliseconds poll_timeout;
    LoggerPtr log;

    UpdateCallback on_update;
    ClosedCallback on_closed;

    std::mutex send_mutex;                      ///< Keeps ids in wire order
    int64_t next_req_id = 1;
    mutable std::mutex pending_mutex;
    std::map<int64_t, RequestKind> pending;

    std::atomic<bool> stop_requested{false};
    std::atomic<bool> running{false};
    std::thread receiver;

    void ReceiveLoop();
    void HandleResult(const nlohmann::json& message);
    void HandleVariableUpdates(const nlohmann::json& data);
    void HandleCommandUpdates(const nlohmann::json& data);
    void Deliver(const EntryUpdate& update);
    int64_t SubscribeVariables(const std::vector<std::string>& paths, bool subscribe);
    int64_t SubscribeCommandNames(const std::vector<std::string>& names, bool subscribe);

public:
    SubscriptionChannel(std::shared_ptr<MessageStream> stream, VariableRegistry& registry,
                        std::chrono::milliseconds poll_timeout, LoggerPtr log);
    ~SubscriptionChannel();

    SubscriptionChannel(const SubscriptionChannel&) = delete;
    SubscriptionChannel& operator=(const SubscriptionChannel&) = delete;

    /** Set before Start(). Called on the receive thread. */
    void SetUpdateCallback(UpdateCallback callback) { on_update = std::move(callback); }

    /** Called on the receive thread when the peer ends the session (not after Stop()). */
    void SetClosedCallback(ClosedCallback callback) { on_closed = std::move(callback); }

    /**
     * @brief Starts the receive thread.
     * @return false if already running or the stream is not open
     */
    bool Start();

    /** Stops the receive thread and closes the stream. Pending requests are dropped. */
    void Stop();

    bool IsRunning() const { return running.load(); }

    /**
     * @brief Sends one request.
     * @return request id, -1 if not sent (stream closed or send failure)
     */
    int64_t Send(const nlohmann::json& request, RequestKind kind = RequestKind::Other);

    /**
     * @brief Subscribes to dataref values. Paths may carry an index: "sim/x/y[3]".
     * @return request id, -1 if nothing was sent
     * @throws NotConnected if the registry has no directory bound
     */
    int64_t Subscribe(const std::vector<std::string>& paths) { return SubscribeVariables(paths, true); }
    int64_t Unsubscribe(const std::vector<std::string>& paths) { return SubscribeVariables(paths, false); }

    int64_t SubscribeCommands(const std::vector<std::string>& names) { return SubscribeCommandNames(names, true); }
    int64_t UnsubscribeCommands(const std::vector<std::string>& names) { return SubscribeCommandNames(names, false); }

    /** dataref_set_values for "name" or "name[index]". */
    int64_t SetVariable(const std::string& path, const nlohmann::json& value);

    /** command_set_is_active, with a duration for a one-shot press. */
    int64_t ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration = std::nullopt);

    /**
     * @brief Decodes one inbound message and applies it.
     * @throws DecodeError for unparsable messages
     */
    void HandleMessage(const std::string& text);

    size_t PendingCount() const;
    std::optional<RequestKind> PendingKind(int64_t req_id) const;
};

/**
 * @brief Stores a raw update value into an entry according to its type.
 * Array values are spread over the subscribed indices; a length mismatch
 * retries with the previous index list, then drops the update.
 * @return true if the entry value changed
 */
bool ApplyRawValue(VariableEntry& entry, const nlohmann::json& raw, const LoggerPtr& log);

} // namespace XPlaneBridge
