// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_inspector.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace vbridge {

namespace {

constexpr const char* PLACEHOLDER = "---";
constexpr size_t RULE_WIDTH = 105;

const std::string& or_placeholder(const std::string& value) {
    static const std::string placeholder = PLACEHOLDER;
    return value.empty() ? placeholder : value;
}

std::string yes_no(bool value) {
    return value ? "Yes" : "No";
}

std::string optional_value(const std::optional<uint32_t>& value) {
    return value ? std::to_string(*value) : "(default)";
}

std::string join_or_unset(const std::vector<std::string>& values) {
    if (values.empty()) {
        return "(Not set)";
    }
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        out += (i == 0 ? "" : ", ") + values[i];
    }
    return out;
}

} // namespace

NetworkInspector::NetworkInspector(NmBackend& backend, std::vector<std::string> ignored_prefixes)
    : backend_(backend), ignored_prefixes_(std::move(ignored_prefixes)) {}

BridgeError NetworkInspector::list_devices(std::vector<Device>& devices) {
    spdlog::debug("[NetworkInspector] Querying devices");
    return backend_.get_devices(devices);
}

BridgeError NetworkInspector::list_connections(std::vector<ConnectionProfile>& connections) {
    spdlog::debug("[NetworkInspector] Querying connection profiles");
    return backend_.get_connections(connections);
}

BridgeError NetworkInspector::list_bridges(std::vector<BridgeProfile>& bridges) {
    std::vector<ConnectionProfile> connections;
    BridgeError err = list_connections(connections);
    if (!err) {
        return err;
    }

    bridges.clear();
    for (const auto& conn : connections) {
        if (!conn.is_bridge() || conn.uuid.empty()) {
            continue;
        }
        BridgeProfile bridge;
        bridge.profile = conn;
        if (!bridge.profile.bridge) {
            bridge.profile.bridge = BridgeSettings{};
        }
        bridges.push_back(std::move(bridge));
    }

    for (const auto& conn : connections) {
        if (!conn.is_bridge_port() || conn.master.empty()) {
            continue;
        }
        for (auto& bridge : bridges) {
            if (conn.master == bridge.profile.uuid ||
                (!bridge.profile.interface_name.empty() &&
                 conn.master == bridge.profile.interface_name)) {
                bridge.ports.push_back({conn.interface_name, conn.id, conn.uuid});
                break;
            }
        }
    }

    for (auto& bridge : bridges) {
        auto live = backend_.get_live_ipv4(bridge.profile.interface_name);
        if (live) {
            bridge.profile.ipv4.addresses = live->addresses;
            bridge.profile.ipv4.gateway = live->gateway;
            bridge.profile.ipv4.dns = live->dns;
        }
    }

    spdlog::debug("[NetworkInspector] Found {} bridge profile(s)", bridges.size());
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NetworkInspector::find_connection(const std::string& name_or_uuid,
                                              ConnectionProfile& out) {
    std::vector<ConnectionProfile> connections;
    BridgeError err = list_connections(connections);
    if (!err) {
        return err;
    }

    for (const auto& conn : connections) {
        if (conn.id == name_or_uuid || conn.uuid == name_or_uuid) {
            spdlog::debug("[NetworkInspector] Found connection {} (UUID {})", conn.id, conn.uuid);
            out = conn;
            return BridgeError(BridgeResult::SUCCESS);
        }
    }

    return BridgeError(BridgeResult::CONNECTION_NOT_FOUND, "no profile matches " + name_or_uuid,
                       "Connection '" + name_or_uuid + "' not found");
}

bool NetworkInspector::is_ignored(const std::string& interface) const {
    return std::any_of(ignored_prefixes_.begin(), ignored_prefixes_.end(),
                       [&](const std::string& prefix) {
                           return !prefix.empty() && interface.rfind(prefix, 0) == 0;
                       });
}

std::vector<std::string> NetworkInspector::slave_candidates() {
    std::vector<std::string> candidates;
    std::vector<Device> devices;
    if (!list_devices(devices)) {
        return candidates;
    }

    for (const auto& dev : devices) {
        if (dev.type != device_type::ETHERNET && dev.type != device_type::WIFI) {
            continue;
        }
        if (is_ignored(dev.interface)) {
            continue;
        }
        candidates.push_back(dev.interface);
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

std::vector<std::string> NetworkInspector::connection_identifiers() {
    std::vector<std::string> identifiers;
    std::vector<ConnectionProfile> connections;
    if (!list_connections(connections)) {
        return identifiers;
    }

    for (const auto& conn : connections) {
        identifiers.push_back(conn.id);
        identifiers.push_back(conn.uuid);
    }
    return identifiers;
}

// ============================================================================
// Report formatting
// ============================================================================

std::string format_device_table(const std::vector<Device>& devices) {
    std::string out = fmt::format("{:<15} {:<12} {:<20} {:<15} {:<18} {}\n", "INTERFACE",
                                  "DEV TYPE", "MAC ADDRESS", "STATE", "CONNECTION", "AUTOCONNECT");
    out += std::string(RULE_WIDTH, '=') + "\n";

    for (const auto& dev : devices) {
        out += fmt::format("{:<15} {:<12} {:<20} {:<15} {:<18} {}\n", dev.interface,
                           device_type_name(dev.type), or_placeholder(dev.mac_address),
                           device_state_name(dev.state), or_placeholder(dev.connection),
                           yes_no(dev.autoconnect));
    }
    return out;
}

std::string format_connection_table(const std::vector<ConnectionProfile>& connections) {
    std::vector<const ConnectionProfile*> sorted;
    for (const auto& conn : connections) {
        sorted.push_back(&conn);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ConnectionProfile* a, const ConnectionProfile* b) {
                         return a->id < b->id;
                     });

    std::string out = fmt::format("{:<30} {:<18} {:<15} {}\n", "NAME (ID)", "TYPE", "INTERFACE",
                                  "UUID");
    out += std::string(RULE_WIDTH, '=') + "\n";

    for (const auto* conn : sorted) {
        out += fmt::format("{:<30} {:<18} {:<15} {}\n", or_placeholder(conn->id),
                           or_placeholder(conn->type), or_placeholder(conn->interface_name),
                           or_placeholder(conn->uuid));
    }
    return out;
}

std::string format_bridge_report(const std::vector<BridgeProfile>& bridges) {
    if (bridges.empty()) {
        return "No existing bridge connections found.\n";
    }

    std::string out = fmt::format("--- Found {} Bridge(s) ---\n", bridges.size());
    for (size_t i = 0; i < bridges.size(); ++i) {
        const BridgeProfile& bridge = bridges[i];
        const ConnectionProfile& p = bridge.profile;
        BridgeSettings b = p.bridge.value_or(BridgeSettings{});

        out += fmt::format("  Bridge Profile: {}\n", p.id);
        out += fmt::format("  |- Interface:    {}\n", or_placeholder(p.interface_name));
        out += fmt::format("  |- UUID:         {}\n", p.uuid);
        if (bridge.ports.empty()) {
            out += "  |- Slave:       (None)\n";
        } else {
            out += "  |- Slave(s):\n";
            for (const auto& port : bridge.ports) {
                out += fmt::format("  |  |- {} (Profile: {})\n", or_placeholder(port.interface),
                                   port.conn_id);
            }
        }

        out += "  |- Bridge Settings:\n";
        out += fmt::format("  |  |- STP Enabled:   {}\n", yes_no(b.stp));
        out += fmt::format("  |  |- STP Priority:  {}\n", optional_value(b.priority));
        out += fmt::format("  |  |- Forward Delay: {}\n", optional_value(b.forward_delay));
        out += fmt::format("  |  |- IGMP snooping: {}\n", yes_no(b.multicast_snooping));
        out += fmt::format("  |  |- VLAN Filtering: {}\n", yes_no(b.vlan_filtering));
        if (b.vlan_filtering) {
            out += fmt::format("  |   - vlan-default-pvid:    {}\n",
                               optional_value(b.vlan_default_pvid));
        }
        out += fmt::format("  |   - MAC:    {}\n",
                           b.mac_address.empty() ? std::string("Not set") : b.mac_address);

        out += fmt::format("  |- IPv4 Config:  ({})\n",
                           p.ipv4.method.empty() ? std::string("disabled") : p.ipv4.method);
        out += fmt::format("  |  |- Address: {}\n", join_or_unset(p.ipv4.addresses));
        out += fmt::format("  |  |- Gateway: {}\n",
                           p.ipv4.gateway.empty() ? std::string("(Not set)") : p.ipv4.gateway);
        out += fmt::format("  |   - DNS:     {}\n", join_or_unset(p.ipv4.dns));

        if (i + 1 < bridges.size()) {
            out += "\n";
        }
    }
    return out;
}

} // namespace vbridge
