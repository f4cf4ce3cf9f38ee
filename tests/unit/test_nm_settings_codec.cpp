// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_settings_codec.h"

#include <arpa/inet.h>

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

TEST_CASE("MAC address conversion", "[nm_settings_codec]") {
    SECTION("parses colon separated hex") {
        auto bytes = mac_to_bytes("52:54:00:ab:CD:0f");
        REQUIRE(bytes == std::vector<uint8_t>{0x52, 0x54, 0x00, 0xab, 0xcd, 0x0f});
    }

    SECTION("rejects malformed input") {
        REQUIRE(mac_to_bytes("").empty());
        REQUIRE(mac_to_bytes("52:54:00").empty());
        REQUIRE(mac_to_bytes("52:54:00:ab:cd:0f:11").empty());
        REQUIRE(mac_to_bytes("zz:54:00:ab:cd:0f").empty());
    }

    SECTION("formats upper case") {
        REQUIRE(bytes_to_mac({0x52, 0x54, 0x00, 0xab, 0xcd, 0x0f}) == "52:54:00:AB:CD:0F");
        REQUIRE(bytes_to_mac({}).empty());
    }
}

TEST_CASE("IPv4 addresses from network byte order", "[nm_settings_codec]") {
    REQUIRE(ipv4_to_string(htonl(0xC0A87A01)) == "192.168.122.1");
    REQUIRE(ipv4_to_string(0) == "0.0.0.0");
}

TEST_CASE("Bridge profile encoding", "[nm_settings_codec]") {
    ConnectionProfile profile;
    profile.id = "c-mybr0";
    profile.uuid = "11111111-2222-4333-8444-555555555555";
    profile.type = "bridge";
    profile.interface_name = "mybr0";
    profile.ipv4.method = "auto";
    BridgeSettings b;
    b.stp = false;
    b.priority = 4096;
    b.mac_address = "52:54:00:12:34:56";
    profile.bridge = b;

    NmSettings settings = profile_to_settings(profile);

    REQUIRE(settings["connection"]["id"].get<std::string>() == "c-mybr0");
    REQUIRE(settings["connection"]["interface-name"].get<std::string>() == "mybr0");
    REQUIRE(settings["connection"].count("master") == 0);
    REQUIRE(settings["bridge"]["stp"].get<bool>() == false);
    REQUIRE(settings["bridge"]["priority"].get<uint32_t>() == 4096);
    REQUIRE(settings["bridge"].count("forward-delay") == 0);
    REQUIRE(settings["bridge"].count("vlan-default-pvid") == 0);
    REQUIRE(settings["bridge"]["mac-address"].get<std::vector<uint8_t>>().size() == 6);
    REQUIRE(settings["ipv4"]["method"].get<std::string>() == "auto");
    REQUIRE(settings.count("ipv6") == 0);
}

TEST_CASE("Port profile encoding", "[nm_settings_codec]") {
    ConnectionProfile port;
    port.id = "c-mybr0-port-eth0";
    port.uuid = "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee";
    port.type = "802-3-ethernet";
    port.interface_name = "eth0";
    port.master = "11111111-2222-4333-8444-555555555555";
    port.slave_type = "bridge";

    NmSettings settings = profile_to_settings(port);

    REQUIRE(settings["connection"]["master"].get<std::string>() == port.master);
    REQUIRE(settings["connection"]["slave-type"].get<std::string>() == "bridge");
    REQUIRE(settings.count("bridge") == 0);
    REQUIRE(settings.count("ipv4") == 0);
}

TEST_CASE("Settings parsing", "[nm_settings_codec]") {
    NmSettings settings;
    settings["connection"]["id"] = sdbus::Variant(std::string("br-lab"));
    settings["connection"]["uuid"] = sdbus::Variant(std::string("uuid-1"));
    settings["connection"]["type"] = sdbus::Variant(std::string("bridge"));
    settings["connection"]["interface-name"] = sdbus::Variant(std::string("br0"));

    SECTION("missing bridge keys fall back to NetworkManager defaults") {
        ConnectionProfile profile = settings_to_profile(settings);
        REQUIRE(profile.is_bridge());
        REQUIRE(profile.bridge.has_value());
        REQUIRE(profile.bridge->stp);
        REQUIRE(profile.bridge->multicast_snooping);
        REQUIRE_FALSE(profile.bridge->vlan_filtering);
        REQUIRE_FALSE(profile.bridge->priority.has_value());
        REQUIRE(profile.ipv4.method == "disabled");
    }

    SECTION("bridge and ipv4 values are read") {
        settings["bridge"]["forward-delay"] = sdbus::Variant(uint32_t{15});
        settings["bridge"]["vlan-filtering"] = sdbus::Variant(true);
        settings["bridge"]["vlan-default-pvid"] = sdbus::Variant(uint32_t{10});
        settings["bridge"]["mac-address"] =
            sdbus::Variant(std::vector<uint8_t>{0x52, 0x54, 0x00, 0x12, 0x34, 0x56});
        settings["ipv4"]["method"] = sdbus::Variant(std::string("manual"));
        settings["ipv4"]["gateway"] = sdbus::Variant(std::string("10.0.0.1"));
        settings["ipv4"]["dns"] = sdbus::Variant(std::vector<uint32_t>{htonl(0x08080808)});

        std::map<std::string, sdbus::Variant> address;
        address["address"] = sdbus::Variant(std::string("10.0.0.5"));
        address["prefix"] = sdbus::Variant(uint32_t{24});
        settings["ipv4"]["address-data"] =
            sdbus::Variant(std::vector<std::map<std::string, sdbus::Variant>>{address});

        ConnectionProfile profile = settings_to_profile(settings);
        REQUIRE(profile.bridge->forward_delay == 15u);
        REQUIRE(profile.bridge->vlan_filtering);
        REQUIRE(profile.bridge->vlan_default_pvid == 10u);
        REQUIRE(profile.bridge->mac_address == "52:54:00:12:34:56");
        REQUIRE(profile.ipv4.method == "manual");
        REQUIRE(profile.ipv4.addresses == std::vector<std::string>{"10.0.0.5/24"});
        REQUIRE(profile.ipv4.gateway == "10.0.0.1");
        REQUIRE(profile.ipv4.dns == std::vector<std::string>{"8.8.8.8"});
    }

    SECTION("mistyped values are ignored") {
        settings["bridge"]["priority"] = sdbus::Variant(std::string("high"));
        ConnectionProfile profile = settings_to_profile(settings);
        REQUIRE_FALSE(profile.bridge->priority.has_value());
    }

    SECTION("non-bridge profiles carry no bridge section") {
        settings["connection"]["type"] = sdbus::Variant(std::string("802-3-ethernet"));
        ConnectionProfile profile = settings_to_profile(settings);
        REQUIRE_FALSE(profile.bridge.has_value());
    }
}
