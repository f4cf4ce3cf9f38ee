// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_planner.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vbridge {

namespace {

BridgeError check_range(const char* field, const std::optional<long>& value, long min, long max) {
    if (value && (*value < min || *value > max)) {
        return BridgeError(BridgeResult::INVALID_PARAMETER,
                           fmt::format("{}={} outside [{}, {}]", field, *value, min, max),
                           fmt::format("Invalid {} {}: must be between {} and {}", field, *value,
                                       min, max));
    }
    return BridgeError(BridgeResult::SUCCESS);
}

std::optional<uint32_t> to_u32(const std::optional<long>& value) {
    if (!value) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

} // namespace

std::string port_connection_name(const std::string& conn_name, const std::string& slave) {
    return conn_name + "-port-" + slave;
}

BridgePlanner::BridgePlanner(NetworkInspector& inspector) : inspector_(inspector) {}

BridgeError BridgePlanner::validate(const BridgeOptions& options) const {
    if (options.conn_name.empty()) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, "empty conn_name",
                           "Connection name must not be empty");
    }
    if (options.bridge_ifname.empty()) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, "empty bridge_ifname",
                           "Bridge interface name must not be empty");
    }
    if (auto err = check_range("stp-priority", options.stp_priority, STP_PRIORITY_MIN,
                               STP_PRIORITY_MAX);
        !err) {
        return err;
    }
    if (auto err = check_range("fdelay", options.forward_delay, FORWARD_DELAY_MIN,
                               FORWARD_DELAY_MAX);
        !err) {
        return err;
    }
    return check_range("vlan-default-pvid", options.vlan_default_pvid, VLAN_PVID_MIN,
                       VLAN_PVID_MAX);
}

BridgeError BridgePlanner::select_slave(const std::vector<Device>& devices,
                                        std::string& interface) const {
    std::vector<const Device*> sorted;
    for (const auto& dev : devices) {
        if (!inspector_.is_ignored(dev.interface)) {
            sorted.push_back(&dev);
        }
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Device* a, const Device* b) { return a->interface < b->interface; });

    for (uint32_t wanted : {device_type::ETHERNET, device_type::WIFI}) {
        for (const Device* dev : sorted) {
            if (dev->type == wanted && dev->state == device_state::ACTIVATED) {
                spdlog::info("[BridgePlanner] Selected {} device {} as slave interface",
                             device_type_name(dev->type), dev->interface);
                interface = dev->interface;
                return BridgeError(BridgeResult::SUCCESS);
            }
        }
    }

    return BridgeError(BridgeResult::NO_CANDIDATE_INTERFACE,
                       "no activated Ethernet or Wi-Fi device",
                       "Could not find a suitable default slave interface");
}

BridgeError BridgePlanner::plan(const BridgeOptions& options, const RunOptions& run,
                                BridgePlan& plan) {
    if (auto err = validate(options); !err) {
        return err;
    }

    std::vector<Device> devices;
    if (auto err = inspector_.list_devices(devices); !err) {
        return err;
    }

    BridgePlan result;
    result.conn_name = options.conn_name;
    result.bridge_ifname = options.bridge_ifname;
    result.force = run.force;
    result.dry_run = run.dry_run;

    if (options.slave_interface.empty()) {
        spdlog::info("[BridgePlanner] No slave interface provided, selecting a default");
        if (auto err = select_slave(devices, result.slave_interface); !err) {
            return err;
        }
        result.slave_auto_selected = true;
    } else {
        result.slave_interface = options.slave_interface;
    }

    auto slave_it = std::find_if(devices.begin(), devices.end(), [&](const Device& dev) {
        return dev.interface == result.slave_interface;
    });
    if (slave_it == devices.end()) {
        return BridgeError(BridgeResult::INTERFACE_NOT_FOUND,
                           "interface absent from device list: " + result.slave_interface,
                           "No interface: " + result.slave_interface);
    }

    std::vector<BridgeProfile> bridges;
    if (auto err = inspector_.list_bridges(bridges); !err) {
        return err;
    }
    for (const auto& bridge : bridges) {
        if (!bridge.has_port(result.slave_interface)) {
            continue;
        }
        // A port of the bridge being replaced is reported by the builder as BRIDGE_EXISTS
        bool same_bridge = bridge.profile.id == result.conn_name ||
                           bridge.profile.interface_name == result.bridge_ifname;
        if (same_bridge) {
            continue;
        }
        if (!run.force) {
            return BridgeError(BridgeResult::INTERFACE_ALREADY_BRIDGED,
                               result.slave_interface + " is a port of " + bridge.profile.uuid,
                               "Interface " + result.slave_interface +
                                   " is already a port of bridge '" + bridge.profile.id +
                                   "' (use --force to take it over)");
        }
        spdlog::warn("[BridgePlanner] {} is a port of bridge '{}', --force will detach it",
                     result.slave_interface, bridge.profile.id);
    }

    result.port_conn_name = port_connection_name(result.conn_name, result.slave_interface);

    result.bridge.stp = options.stp;
    result.bridge.priority = to_u32(options.stp_priority);
    result.bridge.forward_delay = to_u32(options.forward_delay);
    result.bridge.multicast_snooping = options.multicast_snooping;
    result.bridge.vlan_filtering = options.vlan_filtering;
    result.bridge.vlan_default_pvid = to_u32(options.vlan_default_pvid);

    if (options.clone_mac) {
        if (slave_it->mac_address.empty()) {
            spdlog::warn("[BridgePlanner] {} has no MAC address, not cloning it onto {}",
                         result.slave_interface, result.bridge_ifname);
        } else {
            result.bridge.mac_address = slave_it->mac_address;
            spdlog::debug("[BridgePlanner] Cloning MAC {} from {}", slave_it->mac_address,
                          result.slave_interface);
        }
    }

    spdlog::debug("[BridgePlanner] Plan: conn={} ifname={} slave={} port={} force={} dry_run={}",
                  result.conn_name, result.bridge_ifname, result.slave_interface,
                  result.port_conn_name, result.force, result.dry_run);
    plan = std::move(result);
    return BridgeError(BridgeResult::SUCCESS);
}

} // namespace vbridge
