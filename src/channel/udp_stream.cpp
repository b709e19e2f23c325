///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file udp_stream.cpp
 * @brief JSON requests over RREF/DREF/CMND packets
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "channel/udp_stream.h"

#include "channel/protocol.h"
#include "channel/udp_protocol.h"
#include "core/errors.h"

#include <arpa/inet.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <set>
#include <vector>

namespace XPlaneBridge {

using json = nlohmann::json;

namespace {

constexpr std::chrono::milliseconds RECEIVE_SLICE{20};

std::string ElementPath(const std::string& name, int index) {
    return name + "[" + std::to_string(index) + "]";
}

std::vector<int> Indices(const json& item) {
    std::vector<int> out;
    auto index = item.find("index");
    if (index == item.end()) return out;
    if (index->is_array()) {
        for (const auto& i : *index) out.push_back(i.get<int>());
    } else {
        out.push_back(index->get<int>());
    }
    return out;
}

bool IsWritable(const json& value) {
    return value.is_number() || value.is_boolean();
}

float ToFloat(const json& value) {
    if (value.is_boolean()) return value.get<bool>() ? 1.0f : 0.0f;
    return value.get<float>();
}

} // namespace

UdpStream::UdpStream(std::shared_ptr<UdpDirectory> directory, int frequency, size_t max_slots, LoggerPtr log)
    : directory(std::move(directory)), frequency(frequency), max_slots(max_slots), log(std::move(log)) {}

UdpStream::~UdpStream() {
    Close();
}

void UdpStream::Open(const std::string& host, uint16_t port) {
    peer = sockaddr_in{};
    peer.sin_family = AF_INET;
    peer.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &peer.sin_addr) != 1) {
        throw NetworkError("invalid X-Plane address " + host);
    }

    Socket s(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!s.IsValid()) {
        throw NetworkError(ErrnoText("udp socket()"));
    }
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port = 0;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(s.Fd(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        throw NetworkError(ErrnoText("udp bind()"));
    }

    sock = std::move(s);
    peer_ip = host;
    open = true;
    LOG_INFO(log, "UDP session with {}:{}, {} values/s", host, port, frequency);
}

size_t UdpStream::SlotCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return slots.size();
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Requests
///////////////////////////////////////////////////////////////////////////////////////////////////

void UdpStream::SendPacket(const std::string& packet) {
    ssize_t n = ::sendto(sock.Fd(), packet.data(), packet.size(), 0,
                         reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
    if (n < 0) {
        throw NetworkError(ErrnoText("udp sendto(" + peer_ip + ")"));
    }
    if (static_cast<size_t>(n) != packet.size()) {
        throw NetworkError("udp sendto(" + peer_ip + "): short write");
    }
}

void UdpStream::Reply(int64_t req_id, bool success, const std::string& error) {
    json result = {{"type", protocol::type::RESULT}, {"req_id", req_id}, {"success", success}};
    if (!success) result["error_message"] = error;
    replies.push_back(result.dump());
}

void UdpStream::Send(const std::string& text) {
    json request;
    try {
        request = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("invalid request: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (!open) throw ConnectionClosed();

    int64_t req_id = 0;
    std::string error;
    try {
        req_id = request.at("req_id").get<int64_t>();
        const std::string type = request.at("type").get<std::string>();
        const json& params = request.at("params");
        if (type == protocol::type::DATAREF_SUBSCRIBE) {
            error = Subscribe(params);
        } else if (type == protocol::type::DATAREF_UNSUBSCRIBE) {
            error = Unsubscribe(params);
        } else if (type == protocol::type::DATAREF_SET) {
            error = Write(params);
        } else if (type == protocol::type::COMMAND_SET) {
            error = Activate(params);
        } else if (type == protocol::type::COMMAND_SUBSCRIBE || type == protocol::type::COMMAND_UNSUBSCRIBE) {
            error = "command state is not available over UDP";
        } else {
            error = "request " + type + " is not available over UDP";
        }
    } catch (const json::exception& e) {
        throw DecodeError(std::string("invalid request: ") + e.what());
    } catch (const MalformedPacket& e) {
        error = e.what();
    }
    if (!error.empty()) LOG_WARN(log, "req. {}: {}", req_id, error);
    Reply(req_id, error.empty(), error);
}

std::string UdpStream::Subscribe(const json& params) {
    for (const auto& item : params.at("datarefs")) {
        const int64_t id = item.at("id").get<int64_t>();
        auto name = directory->VariableName(id);
        if (!name) return "unknown dataref id " + std::to_string(id);

        std::vector<int> indices = Indices(item);
        if (indices.empty()) indices.push_back(-1);
        for (int index : indices) {
            auto existing = std::find_if(slots.begin(), slots.end(), [&](const std::pair<const int32_t, Slot>& s) {
                return s.second.id == id && s.second.index == index;
            });
            if (existing != slots.end()) continue;
            if (slots.size() >= max_slots) {
                return "at most " + std::to_string(max_slots) + " datarefs can be subscribed over UDP";
            }
            Slot slot;
            slot.id = id;
            slot.index = index;
            slot.path = index < 0 ? *name : ElementPath(*name, index);
            const int32_t key = next_slot++;
            SendPacket(udp::EncodeSubscription(frequency, key, slot.path));
            LOG_DEBUG(log, "RREF {} -> {}", key, slot.path);
            slots.emplace(key, std::move(slot));
        }
    }
    return std::string();
}

std::string UdpStream::Unsubscribe(const json& params) {
    for (const auto& item : params.at("datarefs")) {
        const int64_t id = item.at("id").get<int64_t>();
        const std::vector<int> indices = Indices(item);
        for (auto it = slots.begin(); it != slots.end();) {
            const Slot& slot = it->second;
            const bool match = slot.id == id &&
                (indices.empty() || std::find(indices.begin(), indices.end(), slot.index) != indices.end());
            if (!match) {
                ++it;
                continue;
            }
            SendPacket(udp::EncodeSubscription(0, it->first, slot.path));
            LOG_DEBUG(log, "RREF {} released ({})", it->first, slot.path);
            it = slots.erase(it);
        }
    }
    return std::string();
}

std::string UdpStream::Write(const json& params) {
    for (const auto& item : params.at("datarefs")) {
        const int64_t id = item.at("id").get<int64_t>();
        auto name = directory->VariableName(id);
        if (!name) return "unknown dataref id " + std::to_string(id);
        const json& value = item.at("value");
        const std::vector<int> indices = Indices(item);

        if (value.is_array()) {
            if (!std::all_of(value.begin(), value.end(), IsWritable)) {
                return "only numbers can be written over UDP (" + *name + ")";
            }
            const int start = indices.empty() ? 0 : indices.front();
            for (size_t i = 0; i < value.size(); ++i) {
                SendPacket(udp::EncodeWrite(ToFloat(value[i]), ElementPath(*name, start + static_cast<int>(i))));
            }
            continue;
        }
        if (!IsWritable(value)) {
            return "only numbers can be written over UDP (" + *name + ")";
        }
        const std::string path = indices.empty() ? *name : ElementPath(*name, indices.front());
        SendPacket(udp::EncodeWrite(ToFloat(value), path));
        LOG_DEBUG(log, "DREF {}={}", path, value.dump());
    }
    return std::string();
}

std::string UdpStream::Activate(const json& params) {
    for (const auto& item : params.at("commands")) {
        const int64_t id = item.at("id").get<int64_t>();
        auto name = directory->CommandName(id);
        if (!name) return "unknown command id " + std::to_string(id);
        if (!item.at("is_active").get<bool>()) {
            LOG_DEBUG(log, "{}: release has no UDP counterpart", *name);
            continue;
        }
        auto duration = item.find("duration");
        if (duration != item.end() && duration->is_number() && duration->get<double>() > 0.0) {
            LOG_DEBUG(log, "{}: duration not available over UDP, sent as a single press", *name);
        }
        SendPacket(udp::EncodeCommand(*name));
        LOG_DEBUG(log, "CMND {}", *name);
    }
    return std::string();
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Values
///////////////////////////////////////////////////////////////////////////////////////////////////

std::optional<std::string> UdpStream::Receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[2048];
    for (;;) {
        if (!open) throw ConnectionClosed();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!replies.empty()) {
                std::string message = std::move(replies.front());
                replies.pop_front();
                return message;
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::nullopt;
        // Close() cannot wake a poll() on a datagram socket, waits are sliced instead
        if (!sock.WaitReadable(std::min(left, RECEIVE_SLICE))) continue;

        sockaddr_in sender{};
        socklen_t sender_len = sizeof(sender);
        ssize_t n = ::recvfrom(sock.Fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&sender), &sender_len);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw NetworkError(ErrnoText("udp recvfrom()"));
        }
        if (sender.sin_addr.s_addr != peer.sin_addr.s_addr) {
            LOG_DEBUG(log, "ignoring {} bytes from another host", n);
            continue;
        }
        auto update = ToUpdate(std::string(buf, static_cast<size_t>(n)));
        if (update) return update;
    }
}

std::optional<std::string> UdpStream::ToUpdate(const std::string& packet) {
    std::vector<std::pair<int32_t, float>> values;
    try {
        values = udp::DecodeValues(packet);
    } catch (const MalformedPacket& e) {
        LOG_DEBUG(log, "{}", e.what());
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex);
    std::set<int64_t> scalars;
    std::set<int64_t> arrays;
    for (const auto& v : values) {
        auto it = slots.find(v.first);
        if (it == slots.end()) {
            LOG_DEBUG(log, "value for released RREF {}", v.first);
            continue;
        }
        it->second.value = v.second;
        (it->second.index < 0 ? scalars : arrays).insert(it->second.id);
    }

    json data = json::object();
    for (const auto& s : slots) {
        const Slot& slot = s.second;
        if (slot.index < 0 && scalars.count(slot.id)) {
            data[std::to_string(slot.id)] = static_cast<double>(slot.value);
        }
    }
    // Elements are reported together, in index order, like the web API does
    for (int64_t id : arrays) {
        std::map<int, float> elements;
        for (const auto& s : slots) {
            if (s.second.id == id && s.second.index >= 0) elements[s.second.index] = s.second.value;
        }
        json list = json::array();
        for (const auto& e : elements) list.push_back(static_cast<double>(e.second));
        data[std::to_string(id)] = std::move(list);
    }
    if (data.empty()) return std::nullopt;
    return json{{"type", protocol::type::DATAREF_UPDATE}, {"data", std::move(data)}}.dump();
}

void UdpStream::Close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!open.exchange(false)) return;
    for (const auto& s : slots) {
        try {
            SendPacket(udp::EncodeSubscription(0, s.first, s.second.path));
        } catch (const NetworkError& e) {
            LOG_DEBUG(log, "RREF {} not released: {}", s.first, e.what());
        }
    }
    LOG_INFO(log, "UDP session with {} closed, {} datarefs released", peer_ip, slots.size());
    slots.clear();
    replies.clear();
}

} // namespace XPlaneBridge
