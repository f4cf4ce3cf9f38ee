// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_backend.h"
#include "nm_backend_mock.h"
#include "uuid_utils.h"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

namespace {

ConnectionProfile make_profile(const std::string& id, const std::string& iface) {
    ConnectionProfile p;
    p.id = id;
    p.uuid = generate_uuid_v4();
    p.type = "802-3-ethernet";
    p.interface_name = iface;
    return p;
}

} // namespace

TEST_CASE("NmBackendMock lifecycle", "[nm_backend][mock]") {
    NmBackendMock backend;

    SECTION("starts when the service is available") {
        REQUIRE_FALSE(backend.is_running());
        REQUIRE(backend.start().success());
        REQUIRE(backend.is_running());
    }

    SECTION("start fails when the service is unavailable") {
        backend.set_service_available(false);
        BridgeError err = backend.start();
        REQUIRE(err.result == BridgeResult::SERVICE_UNAVAILABLE);
        REQUIRE_FALSE(backend.is_running());
    }
}

TEST_CASE("NmBackend factory", "[nm_backend][mock]") {
    auto backend = NmBackend::create(true);
    REQUIRE(backend != nullptr);
    REQUIRE(backend->start().success());

    std::vector<Device> devices;
    REQUIRE(backend->get_devices(devices).success());
    REQUIRE_FALSE(devices.empty());
}

TEST_CASE("NmBackendMock demo host", "[nm_backend][mock]") {
    NmBackendMock backend;
    backend.add_demo_devices();
    backend.start();

    std::vector<Device> devices;
    REQUIRE(backend.get_devices(devices).success());
    auto eth0 = std::find_if(devices.begin(), devices.end(),
                             [](const Device& d) { return d.interface == "eth0"; });
    REQUIRE(eth0 != devices.end());
    REQUIRE(eth0->state == device_state::ACTIVATED);
    REQUIRE(eth0->connection == "Wired connection 1");

    std::vector<ConnectionProfile> connections;
    REQUIRE(backend.get_connections(connections).success());
    REQUIRE(connections.size() == 1);
    REQUIRE(connections[0].active);

    auto live = backend.get_live_ipv4("eth0");
    REQUIRE(live.has_value());
    REQUIRE(live->addresses == std::vector<std::string>{"192.168.122.15/24"});
    REQUIRE_FALSE(backend.get_live_ipv4("eth1").has_value());
}

TEST_CASE("NmBackendMock profile mutations", "[nm_backend][mock]") {
    NmBackendMock backend;
    backend.start();
    backend.add_device(Device("eth0", device_type::ETHERNET, device_state::ACTIVATED));

    ConnectionProfile profile = make_profile("office", "eth0");

    SECTION("added profiles are stored inactive") {
        profile.active = true;
        REQUIRE(backend.add_connection(profile).success());
        REQUIRE(backend.connections().size() == 1);
        REQUIRE_FALSE(backend.connections()[0].active);
        REQUIRE(backend.mutation_count() == 1);
    }

    SECTION("duplicate uuid is rejected") {
        REQUIRE(backend.add_connection(profile).success());
        REQUIRE(backend.add_connection(profile).result == BridgeResult::SERVICE_ERROR);
        REQUIRE(backend.connections().size() == 1);
    }

    SECTION("injected add failure") {
        backend.fail_add_for("office", "invalid property");
        BridgeError err = backend.add_connection(profile);
        REQUIRE(err.result == BridgeResult::SERVICE_ERROR);
        REQUIRE(err.technical_msg == "invalid property");
        REQUIRE(backend.connections().empty());
    }

    SECTION("delete unknown uuid") {
        REQUIRE(backend.delete_connection("nope").result == BridgeResult::CONNECTION_NOT_FOUND);
        REQUIRE(backend.mutation_count() == 0);
    }

    SECTION("activate then deactivate") {
        REQUIRE(backend.add_connection(profile).success());
        REQUIRE(backend.activate_connection(profile.uuid).success());

        std::vector<Device> devices;
        backend.get_devices(devices);
        REQUIRE(devices[0].connection == "office");

        REQUIRE(backend.deactivate_connection(profile.uuid).success());
        REQUIRE_FALSE(backend.connections()[0].active);
        REQUIRE(backend.deactivate_connection(profile.uuid).result ==
                BridgeResult::ACTIVATION_FAILED);
    }

    SECTION("activation replaces the active profile on the same interface") {
        ConnectionProfile other = make_profile("home", "eth0");
        REQUIRE(backend.add_connection(profile).success());
        REQUIRE(backend.add_connection(other).success());
        REQUIRE(backend.activate_connection(profile.uuid).success());
        REQUIRE(backend.activate_connection(other.uuid).success());

        REQUIRE_FALSE(backend.connections()[0].active);
        REQUIRE(backend.connections()[1].active);
    }

    SECTION("injected activation failure") {
        backend.fail_activation_for("office", "no carrier");
        REQUIRE(backend.add_connection(profile).success());
        BridgeError err = backend.activate_connection(profile.uuid);
        REQUIRE(err.result == BridgeResult::ACTIVATION_FAILED);
        REQUIRE(err.technical_msg == "no carrier");
    }
}

TEST_CASE("NmBackendMock unavailable service", "[nm_backend][mock]") {
    NmBackendMock backend;
    backend.start();
    backend.set_service_available(false);

    std::vector<Device> devices;
    REQUIRE(backend.get_devices(devices).result == BridgeResult::SERVICE_UNAVAILABLE);
    std::vector<ConnectionProfile> connections;
    REQUIRE(backend.get_connections(connections).result == BridgeResult::SERVICE_UNAVAILABLE);
    REQUIRE(backend.add_connection(make_profile("x", "eth0")).result ==
            BridgeResult::SERVICE_UNAVAILABLE);
    REQUIRE_FALSE(backend.get_live_ipv4("eth0").has_value());
}
