// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_types.h"

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

TEST_CASE("Device type names", "[nm_types]") {
    REQUIRE(device_type_name(device_type::ETHERNET) == "Ethernet");
    REQUIRE(device_type_name(device_type::WIFI) == "Wi-Fi");
    REQUIRE(device_type_name(device_type::BRIDGE) == "Bridge");
    REQUIRE(device_type_name(device_type::LOOPBACK) == "Loopback");
    REQUIRE(device_type_name(device_type::WIFI_P2P) == "Wi-Fi P2P");
    REQUIRE(device_type_name(32) == "VPRP");
    REQUIRE(device_type_name(99) == "Unknown (99)");
}

TEST_CASE("Device state names", "[nm_types]") {
    REQUIRE(device_state_name(device_state::ACTIVATED) == "Activated");
    REQUIRE(device_state_name(device_state::DISCONNECTED) == "Disconnected");
    REQUIRE(device_state_name(device_state::UNAVAILABLE) == "Unavailable");
    REQUIRE(device_state_name(120) == "Failed");
    REQUIRE(device_state_name(0) == "Unknown (0)");
    REQUIRE(device_state_name(55) == "Unknown (55)");
}

TEST_CASE("BridgeProfile port lookup", "[nm_types]") {
    BridgeProfile bridge;
    bridge.ports.push_back({"eth0", "c-mybr0-port-eth0", "uuid-1"});

    REQUIRE(bridge.has_port("eth0"));
    REQUIRE_FALSE(bridge.has_port("eth1"));
}

TEST_CASE("BridgeSettings equality covers optional keys", "[nm_types]") {
    BridgeSettings a;
    BridgeSettings b;
    REQUIRE(a == b);

    b.priority = 4096;
    REQUIRE(a != b);

    a.priority = 4096;
    a.mac_address = "52:54:00:12:34:56";
    REQUIRE(a != b);
}
