///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_helpers.h
 * @brief Common test utilities and test doubles for X-Plane Bridge tests
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <catch2/catch_all.hpp>

#include "beacon/discovery_listener.h"
#include "bridge/command_processor.h"
#include "channel/message_stream.h"
#include "core/errors.h"
#include "logging/logger.h"
#include "net/socket.h"
#include "registry/directory.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace TestHelpers {

using namespace XPlaneBridge;

/**
 * @brief Sleep for specified milliseconds (useful for async tests)
 */
inline void SleepMs(int milliseconds) {
    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

/**
 * @brief Polls a condition until it holds or the timeout expires
 */
inline bool WaitFor(const std::function<bool()>& condition, int timeout_ms = 2000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        SleepMs(5);
    }
    return condition();
}

/**
 * @brief Check if a string contains a substring
 */
inline bool StringContains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/**
 * @brief Compare floating point numbers with tolerance
 */
inline bool FloatEquals(double a, double b, double epsilon = 0.0001) {
    return std::abs(a - b) < epsilon;
}

/** Logger without sinks unless the test listener initialized logging. */
inline LoggerPtr TestLogger(const std::string& name = "test") {
    return Logger::Create(name);
}

inline BeaconRecord MakeBeacon(const std::string& ip = "192.168.1.20", uint16_t port = 49000,
                               int32_t version = 121400) {
    BeaconRecord rec;
    rec.ip = ip;
    rec.port = port;
    rec.hostname = "sim-pc";
    rec.app_version = version;
    rec.role = 1;
    rec.major = 1;
    rec.minor = 2;
    rec.host_id = 1;
    return rec;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Test doubles
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * In-memory message stream. Tests push inbound messages and inspect what
 * was sent.
 */
class ScriptedStream : public MessageStream {
private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    std::vector<std::string> sent;
    bool open = true;
    bool ended = false;

public:
    void Push(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbound.push_back(message);
        }
        cv.notify_all();
    }

    /** Peer closes after the queued messages. */
    void End() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ended = true;
        }
        cv.notify_all();
    }

    std::vector<std::string> Sent() const {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

    void Send(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!open) throw ConnectionClosed();
        sent.push_back(text);
    }

    std::optional<std::string> Receive(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, timeout, [this]() { return !open || ended || !inbound.empty(); });
        if (!open) throw ConnectionClosed();
        if (!inbound.empty()) {
            std::string msg = inbound.front();
            inbound.pop_front();
            return msg;
        }
        if (ended) {
            open = false;
            throw ConnectionClosed("end of stream");
        }
        return std::nullopt;
    }

    void Close() override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = false;
        }
        cv.notify_all();
    }

    bool IsOpen() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return open;
    }
};

/** Directory answering from fixed tables and counting lookups. */
class CountingDirectory : public IDirectory {
public:
    std::map<std::string, VariableInfo> variables;
    std::map<std::string, CommandInfo> commands;
    std::atomic<int> variable_lookups{0};
    std::atomic<int> command_lookups{0};

    void AddVariable(const std::string& name, int64_t id, ValueType type, bool writable = true) {
        VariableInfo info;
        info.id = id;
        info.name = name;
        info.value_type = type;
        info.writable = writable;
        variables[name] = info;
    }

    void AddCommand(const std::string& name, int64_t id, const std::string& description = "") {
        CommandInfo info;
        info.id = id;
        info.name = name;
        info.description = description;
        commands[name] = info;
    }

    std::optional<VariableInfo> FindVariable(const std::string& name) override {
        ++variable_lookups;
        auto it = variables.find(name);
        if (it == variables.end()) return std::nullopt;
        return it->second;
    }

    std::optional<CommandInfo> FindCommand(const std::string& name) override {
        ++command_lookups;
        auto it = commands.find(name);
        if (it == commands.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Beacon source replaying a script of outcomes. Once the script is used up
 * it keeps returning the last beacon, or IpNotFound if there is none.
 */
class ScriptedBeaconSource : public IBeaconSource {
public:
    enum class Outcome { Found, NotFound, Unsupported };

    struct Step {
        Outcome outcome = Outcome::NotFound;
        BeaconRecord beacon;
    };

private:
    std::mutex mutex;
    std::deque<Step> script;
    std::optional<Step> last;

public:
    std::atomic<int> calls{0};

    void Found(const BeaconRecord& beacon) {
        std::lock_guard<std::mutex> lock(mutex);
        script.push_back({Outcome::Found, beacon});
    }
    void NotFound() {
        std::lock_guard<std::mutex> lock(mutex);
        script.push_back({Outcome::NotFound, BeaconRecord()});
    }
    void Unsupported() {
        std::lock_guard<std::mutex> lock(mutex);
        script.push_back({Outcome::Unsupported, BeaconRecord()});
    }

    BeaconRecord Discover(std::chrono::milliseconds) override {
        ++calls;
        Step step;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!script.empty()) {
                step = script.front();
                script.pop_front();
                last = step;
            } else if (last) {
                step = *last;
            }
        }
        switch (step.outcome) {
        case Outcome::Found: return step.beacon;
        case Outcome::Unsupported: throw VersionNotSupported("beacon 2.0.1");
        case Outcome::NotFound: break;
        }
        throw IpNotFound();
    }
};

/** Command target recording every call. */
class RecordingTarget : public ICommandTarget {
public:
    struct Call {
        std::string name;
        bool is_active = false;
        std::optional<double> duration;
        nlohmann::json value;
        bool is_write = false;
    };
    std::vector<Call> calls;
    int64_t next_id = 1;

    int64_t ActivateCommand(const std::string& name, bool is_active, std::optional<double> duration) override {
        calls.push_back({name, is_active, duration, nullptr, false});
        return next_id++;
    }

    int64_t SetVariable(const std::string& path, const nlohmann::json& value) override {
        calls.push_back({path, false, std::nullopt, value, true});
        return next_id++;
    }
};

///////////////////////////////////////////////////////////////////////////////////////////////////
// Local TCP server
///////////////////////////////////////////////////////////////////////////////////////////////////

/**
 * Listens on 127.0.0.1 (ephemeral port) and runs the handler for each of the
 * first `connections` accepted connections, one after the other, on a
 * background thread.
 */
class LocalServer {
private:
    Socket listener;
    std::thread worker;
    uint16_t port = 0;

public:
    explicit LocalServer(std::function<void(Socket&)> handler, int connections = 1) {
        listener = Socket(::socket(AF_INET, SOCK_STREAM, 0));
        REQUIRE(listener.IsValid());
        int yes = 1;
        ::setsockopt(listener.Fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(listener.Fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(listener.Fd(), 4) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(listener.Fd(), reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port = ntohs(addr.sin_port);

        const int fd = listener.Fd();
        worker = std::thread([fd, handler, connections]() {
            for (int i = 0; i < connections; ++i) {
                Socket client(::accept(fd, nullptr, nullptr));
                if (!client.IsValid()) return;
                handler(client);
            }
        });
    }

    ~LocalServer() {
        // Unblocks accept() if no client ever came
        ::shutdown(listener.Fd(), SHUT_RDWR);
        if (worker.joinable()) worker.join();
    }

    uint16_t Port() const { return port; }
};

/** Reads from a socket until the marker shows up (or the peer closes). */
inline std::string ReadUntil(Socket& sock, const std::string& marker, int timeout_ms = 2000) {
    std::string data;
    char buf[1024];
    while (data.find(marker) == std::string::npos) {
        if (!sock.WaitReadable(std::chrono::milliseconds(timeout_ms))) break;
        size_t n = sock.Receive(buf, sizeof(buf));
        if (n == 0) break;
        data.append(buf, n);
    }
    return data;
}

} // namespace TestHelpers
