///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_stream.h
 * @brief Message stream over the legacy X-Plane UDP interface
 *
 * Speaks the same JSON requests as the web API stream so the subscription
 * channel does not know which transport it drives:
 *  - dataref subscriptions become one RREF slot per dataref or array element
 *  - dataref writes become DREF packets (numbers only, one per element)
 *  - command activations become CMND packets (a press; releases are no-ops)
 *  - command state subscriptions are refused, UDP does not report them
 *
 * Every request is answered with a local "result" message. RREF replies are
 * turned into "dataref_update_values" messages keyed by the directory ids.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "channel/message_stream.h"
#include "logging/logger.h"
#include "net/socket.h"
#include "registry/udp_directory.h"

#include <nlohmann/json.hpp>

#include <netinet/in.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace XPlaneBridge {

constexpr int DEFAULT_UDP_FREQUENCY = 1;
constexpr int DEFAULT_UDP_MAX_DATAREFS = 80;

class UdpStream : public MessageStream {
private:
    /** One RREF subscription: a dataref, or one element of it. */
    struct Slot {
        int64_t id = 0;
        int index = -1;                     ///< -1: the dataref itself
        std::string path;                   ///< Path as sent, "name[i]" for elements
        float value = 0.0f;
    };

    std::shared_ptr<UdpDirectory> directory;
    int frequency;
    size_t max_slots;
    LoggerPtr log;

    Socket sock;
    sockaddr_in peer{};
    std::string peer_ip;
    std::atomic<bool> open{false};

    std::mutex mutex;
    std::map<int32_t, Slot> slots;          ///< Guarded by mutex, key is the RREF index
    int32_t next_slot = 0;
    std::deque<std::string> replies;        ///< Local result messages not yet received

    void SendPacket(const std::string& packet);
    void Reply(int64_t req_id, bool success, const std::string& error = std::string());

    // Request handlers, called with mutex held; return an error text or empty
    std::string Subscribe(const nlohmann::json& params);
    std::string Unsubscribe(const nlohmann::json& params);
    std::string Write(const nlohmann::json& params);
    std::string Activate(const nlohmann::json& params);

    std::optional<std::string> ToUpdate(const std::string& packet);

public:
    UdpStream(std::shared_ptr<UdpDirectory> directory, int frequency, size_t max_slots, LoggerPtr log);
    ~UdpStream() override;

    /**
     * @brief Creates the local socket; replies come back to its ephemeral port.
     * @throws NetworkError if the address is invalid or the socket cannot be bound
     */
    void Open(const std::string& host, uint16_t port);

    /**
     * @brief Translates one JSON request into UDP packets.
     * @throws ConnectionClosed after Close()
     * @throws NetworkError if a packet cannot be sent
     * @throws DecodeError if the request is not valid JSON
     */
    void Send(const std::string& text) override;
    std::optional<std::string> Receive(std::chrono::milliseconds timeout) override;

    /** Stops all RREF slots at the simulator, best effort. */
    void Close() override;
    bool IsOpen() const override { return open.load(); }

    size_t SlotCount();
};

} // namespace XPlaneBridge
