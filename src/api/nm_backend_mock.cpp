// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_backend_mock.h"

#include "uuid_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace vbridge {

NmBackendMock::NmBackendMock() : running_(false), available_(true), mutation_count_(0) {
    spdlog::debug("[NmBackendMock] Created");
}

NmBackendMock::~NmBackendMock() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[NmBackendMock] Mock backend destroyed\n");
}

BridgeError NmBackendMock::start() {
    if (!available_) {
        return BridgeError(BridgeResult::SERVICE_UNAVAILABLE, "mock service marked unavailable",
                           "NetworkManager is not reachable");
    }
    running_ = true;
    spdlog::info("[NmBackendMock] Started - using simulated NetworkManager");
    return BridgeError(BridgeResult::SUCCESS);
}

bool NmBackendMock::is_running() const {
    return running_;
}

BridgeError NmBackendMock::check_available(const char* op) const {
    if (!available_) {
        return BridgeError(BridgeResult::SERVICE_UNAVAILABLE,
                           std::string("mock service unavailable during ") + op,
                           "NetworkManager is not reachable");
    }
    return BridgeError(BridgeResult::SUCCESS);
}

ConnectionProfile* NmBackendMock::find_by_uuid(const std::string& uuid) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const ConnectionProfile& c) { return c.uuid == uuid; });
    return it == connections_.end() ? nullptr : &*it;
}

Device* NmBackendMock::find_device(const std::string& interface) {
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const Device& d) { return d.interface == interface; });
    return it == devices_.end() ? nullptr : &*it;
}

BridgeError NmBackendMock::get_devices(std::vector<Device>& devices) {
    if (auto err = check_available("GetAllDevices"); !err) {
        return err;
    }
    devices = devices_;
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendMock::get_connections(std::vector<ConnectionProfile>& connections) {
    if (auto err = check_available("ListConnections"); !err) {
        return err;
    }
    connections = connections_;
    return BridgeError(BridgeResult::SUCCESS);
}

std::optional<Ipv4Config> NmBackendMock::get_live_ipv4(const std::string& interface) {
    if (!available_) {
        return std::nullopt;
    }
    auto it = live_ipv4_.find(interface);
    if (it == live_ipv4_.end()) {
        return std::nullopt;
    }
    return it->second;
}

BridgeError NmBackendMock::add_connection(const ConnectionProfile& profile) {
    if (auto err = check_available("AddConnection"); !err) {
        return err;
    }

    auto fail = add_failures_.find(profile.id);
    if (fail != add_failures_.end()) {
        return BridgeError(BridgeResult::SERVICE_ERROR, fail->second,
                           "NetworkManager rejected profile '" + profile.id + "': " + fail->second);
    }

    if (profile.uuid.empty() || find_by_uuid(profile.uuid)) {
        return BridgeError(BridgeResult::SERVICE_ERROR, "duplicate or empty uuid '" + profile.uuid + "'",
                           "NetworkManager rejected profile '" + profile.id + "'");
    }

    connections_.push_back(profile);
    connections_.back().active = false;
    mutation_count_++;
    spdlog::debug("[NmBackendMock] Added {} ({}, {})", profile.id, profile.type, profile.uuid);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendMock::delete_connection(const std::string& uuid) {
    if (auto err = check_available("Delete"); !err) {
        return err;
    }

    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const ConnectionProfile& c) { return c.uuid == uuid; });
    if (it == connections_.end()) {
        return BridgeError(BridgeResult::CONNECTION_NOT_FOUND, "no profile with uuid " + uuid,
                           "Connection " + uuid + " not found");
    }

    auto fail = delete_failures_.find(it->id);
    if (fail != delete_failures_.end()) {
        return BridgeError(BridgeResult::SERVICE_ERROR, fail->second,
                           "Failed to delete connection '" + it->id + "': " + fail->second);
    }

    if (Device* dev = find_device(it->interface_name); dev && dev->connection == it->id) {
        dev->connection.clear();
    }
    spdlog::debug("[NmBackendMock] Deleted {} ({})", it->id, uuid);
    connections_.erase(it);
    mutation_count_++;
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendMock::activate_connection(const std::string& uuid) {
    if (auto err = check_available("ActivateConnection"); !err) {
        return err;
    }

    ConnectionProfile* profile = find_by_uuid(uuid);
    if (!profile) {
        return BridgeError(BridgeResult::CONNECTION_NOT_FOUND, "no profile with uuid " + uuid,
                           "Connection " + uuid + " not found");
    }

    auto fail = activate_failures_.find(profile->id);
    if (fail != activate_failures_.end()) {
        return BridgeError(BridgeResult::ACTIVATION_FAILED, fail->second,
                           "Failed to activate '" + profile->id + "': " + fail->second);
    }

    // One active profile per interface, like NetworkManager
    for (auto& other : connections_) {
        if (&other != profile && other.active && !other.interface_name.empty() &&
            other.interface_name == profile->interface_name) {
            other.active = false;
        }
    }

    profile->active = true;
    if (Device* dev = find_device(profile->interface_name)) {
        dev->connection = profile->id;
    }
    mutation_count_++;
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendMock::deactivate_connection(const std::string& uuid) {
    if (auto err = check_available("DeactivateConnection"); !err) {
        return err;
    }

    ConnectionProfile* profile = find_by_uuid(uuid);
    if (!profile) {
        return BridgeError(BridgeResult::CONNECTION_NOT_FOUND, "no profile with uuid " + uuid,
                           "Connection " + uuid + " not found");
    }
    if (!profile->active) {
        return BridgeError(BridgeResult::ACTIVATION_FAILED, "connection not active",
                           "Connection '" + profile->id + "' is not active");
    }

    profile->active = false;
    if (Device* dev = find_device(profile->interface_name); dev && dev->connection == profile->id) {
        dev->connection.clear();
    }
    mutation_count_++;
    return BridgeError(BridgeResult::SUCCESS);
}

// ============================================================================
// Test API
// ============================================================================

void NmBackendMock::add_device(const Device& device) {
    if (Device* existing = find_device(device.interface)) {
        *existing = device;
        return;
    }
    devices_.push_back(device);
}

void NmBackendMock::set_service_available(bool available) {
    available_ = available;
}

void NmBackendMock::fail_add_for(const std::string& conn_id, const std::string& message) {
    add_failures_[conn_id] = message;
}

void NmBackendMock::fail_delete_for(const std::string& conn_id, const std::string& message) {
    delete_failures_[conn_id] = message;
}

void NmBackendMock::fail_activation_for(const std::string& conn_id, const std::string& message) {
    activate_failures_[conn_id] = message;
}

void NmBackendMock::set_live_ipv4(const std::string& interface, const Ipv4Config& config) {
    live_ipv4_[interface] = config;
}

void NmBackendMock::clear_all() {
    devices_.clear();
    connections_.clear();
    live_ipv4_.clear();
    add_failures_.clear();
    delete_failures_.clear();
    activate_failures_.clear();
    available_ = true;
    mutation_count_ = 0;
}

void NmBackendMock::add_demo_devices() {
    Device lo("lo", device_type::LOOPBACK, device_state::UNMANAGED, "00:00:00:00:00:00");
    devices_.push_back(lo);

    Device eth0("eth0", device_type::ETHERNET, device_state::ACTIVATED, "52:54:00:12:34:56");
    eth0.connection = "Wired connection 1";
    eth0.autoconnect = true;
    eth0.has_ipv4 = true;
    devices_.push_back(eth0);

    Device eth1("eth1", device_type::ETHERNET, device_state::DISCONNECTED, "52:54:00:65:43:21");
    eth1.autoconnect = true;
    devices_.push_back(eth1);

    Device wlan0("wlan0", device_type::WIFI, device_state::DISCONNECTED, "02:00:00:aa:bb:cc");
    wlan0.autoconnect = true;
    devices_.push_back(wlan0);

    Device virbr0("virbr0", device_type::BRIDGE, device_state::UNMANAGED, "52:54:00:00:be:ef");
    devices_.push_back(virbr0);

    ConnectionProfile wired;
    wired.id = "Wired connection 1";
    wired.uuid = generate_uuid_v4();
    wired.type = "802-3-ethernet";
    wired.interface_name = "eth0";
    wired.active = true;
    wired.ipv4.method = "auto";
    connections_.push_back(wired);

    Ipv4Config live;
    live.method = "auto";
    live.addresses = {"192.168.122.15/24"};
    live.gateway = "192.168.122.1";
    live.dns = {"192.168.122.1"};
    live_ipv4_["eth0"] = live;

    spdlog::debug("[NmBackendMock] Seeded {} demo devices", devices_.size());
}

} // namespace vbridge
