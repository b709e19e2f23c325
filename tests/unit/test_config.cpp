///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_config.cpp
 * @brief Unit tests for environment based configuration
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "config/bridge_config.h"

#include <cstdlib>

using namespace XPlaneBridge;

namespace {

// Sets a variable for the lifetime of the guard
class EnvGuard {
private:
    std::string name;

public:
    EnvGuard(const std::string& name, const std::string& value) : name(name) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Configuration defaults", "[unit][config]") {
    BridgeConfig cfg = BridgeConfig::FromEnvironment();
    REQUIRE(cfg.mcast_group == "239.255.1.1");
    REQUIRE(cfg.mcast_port == 49707);
    REQUIRE(cfg.beacon_timeout == std::chrono::milliseconds(3000));
    REQUIRE(cfg.reconnect_interval == std::chrono::seconds(10));
    REQUIRE(cfg.warn_every == 10);
    REQUIRE(cfg.join_timeout == std::chrono::seconds(10));
    REQUIRE(cfg.api_host.empty());
    REQUIRE(cfg.api_port == 0);
    REQUIRE(cfg.api_version.empty());
    REQUIRE(TestHelpers::StringContains(cfg.Describe(), "239.255.1.1:49707"));
}

TEST_CASE("Configuration from environment", "[unit][config]") {
    SECTION("Valid overrides") {
        EnvGuard group("XPLANE_BRIDGE_MCAST_GROUP", "239.255.1.2");
        EnvGuard port("XPLANE_BRIDGE_MCAST_PORT", "50000");
        EnvGuard reconnect("XPLANE_BRIDGE_RECONNECT_S", "3");
        EnvGuard version("XPLANE_BRIDGE_API_VERSION", "v1");
        EnvGuard api_port("XPLANE_BRIDGE_API_PORT", "9000");

        BridgeConfig cfg = BridgeConfig::FromEnvironment();
        REQUIRE(cfg.mcast_group == "239.255.1.2");
        REQUIRE(cfg.mcast_port == 50000);
        REQUIRE(cfg.reconnect_interval == std::chrono::seconds(3));
        REQUIRE(cfg.api_version == "v1");
        REQUIRE(cfg.api_port == 9000);
        REQUIRE(TestHelpers::StringContains(cfg.Describe(), ":9000 v1"));
    }

    SECTION("Invalid values fall back to defaults") {
        EnvGuard group("XPLANE_BRIDGE_MCAST_GROUP", "not-an-address");
        EnvGuard port("XPLANE_BRIDGE_MCAST_PORT", "70000");
        EnvGuard timeout("XPLANE_BRIDGE_BEACON_TIMEOUT_MS", "12abc");
        EnvGuard warn("XPLANE_BRIDGE_WARN_EVERY", "0");

        BridgeConfig cfg = BridgeConfig::FromEnvironment();
        REQUIRE(cfg.mcast_group == "239.255.1.1");
        REQUIRE(cfg.mcast_port == 49707);
        REQUIRE(cfg.beacon_timeout == std::chrono::milliseconds(3000));
        REQUIRE(cfg.warn_every == 10);
    }
}

TEST_CASE("Transport selection", "[unit][config]") {
    SECTION("Defaults") {
        BridgeConfig cfg = BridgeConfig::FromEnvironment();
        REQUIRE(cfg.transport == "auto");
        REQUIRE(cfg.udp_frequency == 1);
        REQUIRE(cfg.udp_max_datarefs == 80);
        REQUIRE(TestHelpers::StringContains(cfg.Describe(), "transport auto"));
    }

    SECTION("Overrides") {
        EnvGuard transport("XPLANE_BRIDGE_TRANSPORT", "udp");
        EnvGuard freq("XPLANE_BRIDGE_UDP_FREQ", "20");
        BridgeConfig cfg = BridgeConfig::FromEnvironment();
        REQUIRE(cfg.transport == "udp");
        REQUIRE(cfg.udp_frequency == 20);
    }

    SECTION("Unknown transport and out of range frequency are ignored") {
        EnvGuard transport("XPLANE_BRIDGE_TRANSPORT", "serial");
        EnvGuard freq("XPLANE_BRIDGE_UDP_FREQ", "500");
        BridgeConfig cfg = BridgeConfig::FromEnvironment();
        REQUIRE(cfg.transport == "auto");
        REQUIRE(cfg.udp_frequency == 1);
    }
}
