///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_udp_protocol.cpp
 * @brief Unit tests for RREF/DREF/CMND packet layout
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "channel/udp_protocol.h"
#include "core/errors.h"

#include <cstring>

using namespace XPlaneBridge;

namespace {

void AppendLE(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

uint32_t Bits(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

std::string Reply(const std::vector<std::pair<int32_t, float>>& values) {
    std::string out = "RREF,";
    for (const auto& v : values) {
        AppendLE(out, static_cast<uint32_t>(v.first));
        AppendLE(out, Bits(v.second));
    }
    return out;
}

} // namespace

TEST_CASE("RREF requests", "[unit][udp]") {
    const std::string packet = udp::EncodeSubscription(5, 258, "sim/flightmodel/position/elevation");

    SECTION("Fixed size with a NUL padded path") {
        REQUIRE(packet.size() == udp::SUBSCRIPTION_SIZE);
        REQUIRE(packet.size() == 413);
        REQUIRE(packet.compare(0, 5, std::string("RREF\0", 5)) == 0);
        REQUIRE(std::string(packet.c_str() + 13) == "sim/flightmodel/position/elevation");
        REQUIRE(packet.back() == '\0');
    }

    SECTION("Frequency and index are little-endian") {
        REQUIRE(static_cast<uint8_t>(packet[5]) == 5);
        REQUIRE(packet[6] == 0);
        // 258 = 0x0102
        REQUIRE(static_cast<uint8_t>(packet[9]) == 0x02);
        REQUIRE(static_cast<uint8_t>(packet[10]) == 0x01);
    }

    SECTION("Paths that do not fit are refused") {
        REQUIRE_THROWS_AS(udp::EncodeSubscription(1, 0, std::string(400, 'a')), MalformedPacket);
        REQUIRE_THROWS_AS(udp::EncodeSubscription(1, 0, ""), MalformedPacket);
        REQUIRE_NOTHROW(udp::EncodeSubscription(1, 0, std::string(399, 'a')));
    }
}

TEST_CASE("DREF and CMND packets", "[unit][udp]") {
    SECTION("DREF carries the value then the space padded path") {
        const std::string packet = udp::EncodeWrite(0.5f, "sim/cockpit2/controls/flap_ratio");
        REQUIRE(packet.size() == udp::WRITE_SIZE);
        REQUIRE(packet.size() == 509);
        REQUIRE(packet.compare(0, 5, std::string("DREF\0", 5)) == 0);
        // 0.5f = 0x3F000000
        REQUIRE(static_cast<uint8_t>(packet[8]) == 0x3F);
        REQUIRE(std::string(packet.c_str() + 9) == "sim/cockpit2/controls/flap_ratio");
        REQUIRE(packet.back() == ' ');
    }

    SECTION("CMND is the bare path") {
        REQUIRE(udp::EncodeCommand("sim/operation/pause_toggle") == std::string("CMND\0sim/operation/pause_toggle", 31));
    }
}

TEST_CASE("RREF replies", "[unit][udp]") {
    SECTION("Index and value pairs") {
        auto values = udp::DecodeValues(Reply({{0, 1500.5f}, {7, -3.25f}}));
        REQUIRE(values.size() == 2);
        REQUIRE(values[0].first == 0);
        REQUIRE(values[0].second == 1500.5f);
        REQUIRE(values[1].first == 7);
        REQUIRE(values[1].second == -3.25f);
    }

    SECTION("Trailing partial entry is ignored") {
        std::string packet = Reply({{1, 2.0f}});
        packet.append("\x02\x00\x00", 3);
        REQUIRE(udp::DecodeValues(packet).size() == 1);
        REQUIRE(udp::DecodeValues("RREF,").empty());
    }

    SECTION("Values just below zero read as zero") {
        auto values = udp::DecodeValues(Reply({{0, -0.0f}, {1, -0.0005f}, {2, -0.5f}}));
        REQUIRE_FALSE(std::signbit(values[0].second));
        REQUIRE(values[1].second == 0.0f);
        REQUIRE_FALSE(std::signbit(values[1].second));
        REQUIRE(values[2].second == -0.5f);
    }

    SECTION("Other packets are refused") {
        REQUIRE_THROWS_AS(udp::DecodeValues(std::string("DATA*\0\0\0\0", 9)), MalformedPacket);
        REQUIRE_THROWS_AS(udp::DecodeValues("RRE"), MalformedPacket);
    }
}
