///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_udp_stream.cpp
 * @brief Integration tests for the UDP session against a scripted simulator socket
 *
 * The simulator side is a plain UDP socket on 127.0.0.1 that records the
 * packets it receives and answers with RREF replies.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "bridge/simulator_link.h"
#include "channel/subscription_channel.h"
#include "channel/udp_protocol.h"
#include "channel/udp_stream.h"
#include "registry/udp_directory.h"
#include "registry/variable_registry.h"

#include <cstring>
#include <map>
#include <optional>

using namespace XPlaneBridge;

namespace {

const char* ELEVATION = "sim/flightmodel/position/elevation";
const char* N1 = "sim/flightmodel/engine/ENGN_N1_";

int32_t ReadInt32(const std::string& packet, size_t offset) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= uint32_t(static_cast<uint8_t>(packet[offset + i])) << (8 * i);
    return static_cast<int32_t>(v);
}

float ReadFloat(const std::string& packet, size_t offset) {
    const uint32_t bits = static_cast<uint32_t>(ReadInt32(packet, offset));
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

struct RrefRequest {
    int32_t frequency = 0;
    int32_t index = 0;
    std::string path;
};

RrefRequest ParseRref(const std::string& packet) {
    REQUIRE(packet.size() == udp::SUBSCRIPTION_SIZE);
    REQUIRE(packet.compare(0, 5, std::string("RREF\0", 5)) == 0);
    return RrefRequest{ReadInt32(packet, 5), ReadInt32(packet, 9), std::string(packet.c_str() + 13)};
}

std::string ValuesPacket(const std::vector<std::pair<int32_t, float>>& values) {
    std::string out = "RREF,";
    for (const auto& v : values) {
        uint32_t bits = 0;
        std::memcpy(&bits, &v.second, sizeof(bits));
        for (uint32_t word : {static_cast<uint32_t>(v.first), bits}) {
            for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((word >> (8 * i)) & 0xFF));
        }
    }
    return out;
}

// Simulator end of the UDP interface
class UdpPeer {
public:
    Socket sock{::socket(AF_INET, SOCK_DGRAM, 0)};
    uint16_t port = 0;
    sockaddr_in client{};

    UdpPeer() {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(sock.Fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(sock.Fd(), reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port = ntohs(addr.sin_port);
    }

    std::optional<std::string> Next(int timeout_ms = 2000) {
        if (!sock.WaitReadable(std::chrono::milliseconds(timeout_ms))) return std::nullopt;
        char buf[2048];
        socklen_t len = sizeof(client);
        ssize_t n = ::recvfrom(sock.Fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&client), &len);
        if (n < 0) return std::nullopt;
        return std::string(buf, static_cast<size_t>(n));
    }

    // Subscription packets, keyed by path
    std::map<std::string, RrefRequest> NextRrefs(size_t count) {
        std::map<std::string, RrefRequest> out;
        for (size_t i = 0; i < count; ++i) {
            auto packet = Next();
            REQUIRE(packet.has_value());
            RrefRequest request = ParseRref(*packet);
            out[request.path] = request;
        }
        return out;
    }

    void Reply(const std::string& packet) {
        ::sendto(sock.Fd(), packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&client), sizeof(client));
    }
};

struct UdpFixture {
    UdpPeer peer;
    std::shared_ptr<UdpDirectory> directory = std::make_shared<UdpDirectory>();
    std::shared_ptr<UdpStream> stream = std::make_shared<UdpStream>(directory, 5, 4, TestHelpers::TestLogger("udp"));
    VariableRegistry registry{TestHelpers::TestLogger("registry")};
    std::unique_ptr<SubscriptionChannel> channel;

    UdpFixture() {
        stream->Open("127.0.0.1", peer.port);
        registry.SetDirectory(directory);
        channel = std::make_unique<SubscriptionChannel>(stream, registry, std::chrono::milliseconds(20),
                                                        TestHelpers::TestLogger("channel"));
        REQUIRE(channel->Start());
    }

    ~UdpFixture() { channel->Stop(); }

    bool AllAnswered() {
        return TestHelpers::WaitFor([this]() { return channel->PendingCount() == 0; });
    }
};

} // namespace

TEST_CASE("Dataref values arrive through RREF subscriptions", "[integration][udp]") {
    UdpFixture f;
    const std::string n1_first = std::string(N1) + "[0]";
    const std::string n1_third = std::string(N1) + "[2]";

    REQUIRE(f.channel->Subscribe({ELEVATION, n1_third, n1_first}) > 0);
    auto rrefs = f.peer.NextRrefs(3);
    REQUIRE(rrefs.count(ELEVATION) == 1);
    REQUIRE(rrefs.count(n1_first) == 1);
    REQUIRE(rrefs.count(n1_third) == 1);
    REQUIRE(rrefs[ELEVATION].frequency == 5);
    REQUIRE(f.AllAnswered());

    SECTION("Scalars and elements are applied") {
        f.peer.Reply(ValuesPacket({{rrefs[ELEVATION].index, 1500.5f},
                                   {rrefs[n1_first].index, 91.0f},
                                   {rrefs[n1_third].index, 88.5f}}));
        REQUIRE(TestHelpers::WaitFor([&]() {
            auto n1 = f.registry.VariableSnapshot(N1);
            return n1 && std::holds_alternative<std::vector<double>>(n1->value);
        }));
        REQUIRE(std::get<double>(f.registry.VariableSnapshot(ELEVATION)->value) == 1500.5);
        REQUIRE(std::get<std::vector<double>>(f.registry.VariableSnapshot(N1)->value) ==
                std::vector<double>{91.0, 0.0, 88.5});
    }

    SECTION("Unknown slots and foreign packets are ignored") {
        f.peer.Reply(ValuesPacket({{77, 3.0f}}));
        f.peer.Reply(std::string("DATA*\0\0\0\0", 9));
        f.peer.Reply(ValuesPacket({{rrefs[ELEVATION].index, 12.0f}}));
        REQUIRE(TestHelpers::WaitFor([&]() {
            auto elevation = f.registry.VariableSnapshot(ELEVATION);
            return elevation && std::holds_alternative<double>(elevation->value);
        }));
        REQUIRE(std::get<double>(f.registry.VariableSnapshot(ELEVATION)->value) == 12.0);
        REQUIRE(f.channel->IsRunning());
    }
}

TEST_CASE("Writes and commands become DREF and CMND packets", "[integration][udp]") {
    UdpFixture f;

    SECTION("Dataref write") {
        REQUIRE(f.channel->SetVariable("sim/cockpit2/controls/flap_ratio", 0.5) > 0);
        auto packet = f.peer.Next();
        REQUIRE(packet.has_value());
        REQUIRE(packet->size() == udp::WRITE_SIZE);
        REQUIRE(packet->compare(0, 5, std::string("DREF\0", 5)) == 0);
        REQUIRE(ReadFloat(*packet, 5) == 0.5f);
        REQUIRE(std::string(packet->c_str() + 9) == "sim/cockpit2/controls/flap_ratio");
    }

    SECTION("Element and boolean writes") {
        REQUIRE(f.channel->SetVariable("sim/cockpit2/engine/actuators/throttle_ratio[1]", 1) > 0);
        auto element = f.peer.Next();
        REQUIRE(element.has_value());
        REQUIRE(std::string(element->c_str() + 9) == "sim/cockpit2/engine/actuators/throttle_ratio[1]");
        REQUIRE(ReadFloat(*element, 5) == 1.0f);

        REQUIRE(f.channel->SetVariable("sim/cockpit/electrical/beacon_lights_on", true) > 0);
        auto flag = f.peer.Next();
        REQUIRE(flag.has_value());
        REQUIRE(ReadFloat(*flag, 5) == 1.0f);
    }

    SECTION("Whole array writes one packet per element") {
        REQUIRE(f.channel->SetVariable("sim/cockpit2/engine/actuators/mixture_ratio", nlohmann::json{0.25, 0.75}) > 0);
        auto first = f.peer.Next();
        auto second = f.peer.Next();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(std::string(first->c_str() + 9) == "sim/cockpit2/engine/actuators/mixture_ratio[0]");
        REQUIRE(std::string(second->c_str() + 9) == "sim/cockpit2/engine/actuators/mixture_ratio[1]");
        REQUIRE(ReadFloat(*second, 5) == 0.75f);
    }

    SECTION("Command press") {
        REQUIRE(f.channel->ActivateCommand("sim/operation/pause_toggle", true, 0.0) > 0);
        auto packet = f.peer.Next();
        REQUIRE(packet.has_value());
        REQUIRE(*packet == std::string("CMND\0sim/operation/pause_toggle", 31));

        // Releases have no UDP packet but are still answered
        REQUIRE(f.channel->ActivateCommand("sim/operation/pause_toggle", false) > 0);
        REQUIRE_FALSE(f.peer.Next(150).has_value());
        REQUIRE(f.AllAnswered());
    }

    SECTION("Text values are refused without a packet") {
        REQUIRE(f.channel->SetVariable("sim/aircraft/view/acf_tailnum", "N123XP") > 0);
        REQUIRE(f.AllAnswered());
        REQUIRE_FALSE(f.peer.Next(150).has_value());
    }
}

TEST_CASE("RREF slots are released", "[integration][udp]") {
    UdpFixture f;
    REQUIRE(f.channel->Subscribe({"sim/a", "sim/b[1]", "sim/b[3]"}) > 0);
    auto rrefs = f.peer.NextRrefs(3);
    REQUIRE(f.stream->SlotCount() == 3);

    SECTION("Unsubscribing one element stops only that slot") {
        REQUIRE(f.channel->Unsubscribe({"sim/b[1]"}) > 0);
        auto packet = f.peer.Next();
        REQUIRE(packet.has_value());
        RrefRequest stop = ParseRref(*packet);
        REQUIRE(stop.frequency == 0);
        REQUIRE(stop.path == "sim/b[1]");
        REQUIRE(stop.index == rrefs["sim/b[1]"].index);
        REQUIRE(f.stream->SlotCount() == 2);
    }

    SECTION("Closing the session stops every slot") {
        f.channel->Stop();
        auto stops = f.peer.NextRrefs(3);
        REQUIRE(stops.size() == 3);
        for (const auto& s : stops) {
            REQUIRE(s.second.frequency == 0);
            REQUIRE(s.second.index == rrefs[s.first].index);
        }
        REQUIRE_FALSE(f.stream->IsOpen());
        REQUIRE(f.stream->SlotCount() == 0);
    }
}

TEST_CASE("Requests the UDP interface cannot serve are answered as failed", "[integration][udp]") {
    UdpFixture f;

    SECTION("Slot limit") {
        REQUIRE(f.channel->Subscribe({"sim/a", "sim/b", "sim/c", "sim/d", "sim/e"}) > 0);
        f.peer.NextRrefs(4);
        REQUIRE(f.AllAnswered());
        REQUIRE(f.stream->SlotCount() == 4);
        REQUIRE_FALSE(f.peer.Next(150).has_value());
    }

    SECTION("Command state subscriptions") {
        REQUIRE(f.channel->SubscribeCommands({"sim/operation/pause_toggle"}) > 0);
        REQUIRE(f.AllAnswered());
        REQUIRE_FALSE(f.peer.Next(150).has_value());
    }
}

TEST_CASE("Sessions fall back to UDP without a web API", "[integration][udp]") {
    UdpPeer peer;
    auto log = TestHelpers::TestLogger("session");
    const BeaconRecord beacon = TestHelpers::MakeBeacon("127.0.0.1", peer.port, 115000);
    const std::string udp_description = "udp://127.0.0.1:" + std::to_string(peer.port);
    BridgeConfig cfg;

    SECTION("Simulator too old for the web API") {
        Session session = MakeSessionFactory(cfg, log)(beacon);
        REQUIRE(session.description == udp_description);
        REQUIRE(session.stream->IsOpen());
        REQUIRE(std::dynamic_pointer_cast<UdpDirectory>(session.directory) != nullptr);
    }

    SECTION("Web API not reachable") {
        int attempts = 0;
        SessionFactory unreachable = [&attempts](const BeaconRecord& b) -> Session {
            ++attempts;
            throw NetworkError("connect(" + b.ip + ":8086): Connection refused");
        };
        Session session = MakeFallbackSessionFactory(unreachable, MakeUdpSessionFactory(cfg, log), log)(beacon);
        REQUIRE(attempts == 1);
        REQUIRE(session.description == udp_description);
    }

    SECTION("UDP only") {
        cfg.transport = "udp";
        BeaconRecord recent = beacon;
        recent.app_version = 121400;
        REQUIRE(MakeSessionFactory(cfg, log)(recent).description == udp_description);
    }

    SECTION("Web API only") {
        cfg.transport = "webapi";
        REQUIRE_THROWS_AS(MakeSessionFactory(cfg, log)(beacon), VersionNotSupported);
    }

    SECTION("Fallback failures reach the caller") {
        BeaconRecord bad = beacon;
        bad.ip = "not-an-address";
        REQUIRE_THROWS_AS(MakeSessionFactory(cfg, log)(bad), NetworkError);
    }
}
