///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_ws_util.cpp
 * @brief Unit tests for SHA-1 / Base64 helpers
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "net/ws_util.h"

#include <cstdio>

using namespace XPlaneBridge;

namespace {

std::string Hex(const std::array<uint8_t, 20>& digest) {
    std::string out;
    char buf[3];
    for (uint8_t b : digest) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        out += buf;
    }
    return out;
}

} // namespace

TEST_CASE("SHA-1 digests", "[unit][ws_util]") {
    REQUIRE(Hex(ws_util::Sha1("")) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    REQUIRE(Hex(ws_util::Sha1("abc")) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    REQUIRE(Hex(ws_util::Sha1("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
            "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_CASE("WebSocket accept key", "[unit][ws_util]") {
    // Example from RFC 6455 section 1.3
    REQUIRE(ws_util::ComputeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Base64 encoding", "[unit][ws_util]") {
    REQUIRE(ws_util::Base64Encode("") == "");
    REQUIRE(ws_util::Base64Encode("f") == "Zg==");
    REQUIRE(ws_util::Base64Encode("fo") == "Zm8=");
    REQUIRE(ws_util::Base64Encode("foo") == "Zm9v");
    REQUIRE(ws_util::Base64Encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("Base64 decoding", "[unit][ws_util]") {
    std::string out;

    SECTION("Padded input") {
        REQUIRE(ws_util::Base64Decode("Zm9vYg==", out));
        REQUIRE(out == "foob");
    }

    SECTION("Unpadded input") {
        REQUIRE(ws_util::Base64Decode("Zm9vYg", out));
        REQUIRE(out == "foob");
    }

    SECTION("Embedded NUL bytes survive") {
        REQUIRE(ws_util::Base64Decode("QUJDAAA=", out));
        REQUIRE(out == std::string("ABC\0\0", 5));
    }

    SECTION("Invalid characters fail") {
        REQUIRE_FALSE(ws_util::Base64Decode("Zm9v*mFy", out));
    }
}
