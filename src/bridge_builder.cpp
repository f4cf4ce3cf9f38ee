// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_builder.h"

#include "uuid_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vbridge {

namespace {

const char* yes_no(bool value) {
    return value ? "yes" : "no";
}

std::string describe_settings(const BridgeSettings& b) {
    std::string out = fmt::format("stp={} multicast-snooping={} vlan-filtering={}", yes_no(b.stp),
                                  yes_no(b.multicast_snooping), yes_no(b.vlan_filtering));
    if (b.priority) {
        out += fmt::format(" priority={}", *b.priority);
    }
    if (b.forward_delay) {
        out += fmt::format(" forward-delay={}", *b.forward_delay);
    }
    if (b.vlan_default_pvid) {
        out += fmt::format(" vlan-default-pvid={}", *b.vlan_default_pvid);
    }
    if (!b.mac_address.empty()) {
        out += " mac-address=" + b.mac_address;
    }
    return out;
}

} // namespace

BridgeBuilder::BridgeBuilder(NetworkInspector& inspector) : inspector_(inspector) {}

ConnectionProfile BridgeBuilder::make_bridge_profile(const BridgePlan& plan,
                                                     const std::string& uuid) {
    ConnectionProfile profile;
    profile.id = plan.conn_name;
    profile.uuid = uuid;
    profile.type = "bridge";
    profile.interface_name = plan.bridge_ifname;
    profile.ipv4.method = "auto";
    profile.bridge = plan.bridge;
    return profile;
}

ConnectionProfile BridgeBuilder::make_port_profile(const BridgePlan& plan, const std::string& uuid,
                                                   const std::string& master_uuid) {
    ConnectionProfile profile;
    profile.id = plan.port_conn_name;
    profile.uuid = uuid;
    profile.type = "802-3-ethernet";
    profile.interface_name = plan.slave_interface;
    profile.master = master_uuid;
    profile.slave_type = "bridge";
    return profile;
}

BridgeError BridgeBuilder::collect_conflicts(const BridgePlan& plan, std::vector<Doomed>& doomed) {
    std::vector<ConnectionProfile> connections;
    if (auto err = inspector_.list_connections(connections); !err) {
        return err;
    }
    std::vector<BridgeProfile> bridges;
    if (auto err = inspector_.list_bridges(bridges); !err) {
        return err;
    }

    auto add_once = [&doomed](const std::string& uuid, const std::string& id) {
        bool seen = std::any_of(doomed.begin(), doomed.end(),
                                [&](const Doomed& d) { return d.uuid == uuid; });
        if (!seen) {
            doomed.push_back({uuid, id});
        }
    };

    for (const auto& bridge : bridges) {
        if (bridge.profile.id != plan.conn_name &&
            bridge.profile.interface_name != plan.bridge_ifname) {
            continue;
        }
        // Ports first, so the bridge never has dangling ports pointing at it
        for (const auto& port : bridge.ports) {
            add_once(port.uuid, port.conn_id);
        }
        add_once(bridge.profile.uuid, bridge.profile.id);
    }

    for (const auto& conn : connections) {
        if (conn.is_bridge_port() && conn.interface_name == plan.slave_interface) {
            add_once(conn.uuid, conn.id);
        } else if (conn.id == plan.port_conn_name) {
            add_once(conn.uuid, conn.id);
        }
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError BridgeBuilder::delete_all(const std::vector<Doomed>& doomed, bool dry_run,
                                      BuildReport& report) {
    for (const auto& d : doomed) {
        report.operations.push_back(fmt::format("Delete connection '{}' ({})", d.id, d.uuid));
        if (dry_run) {
            continue;
        }
        spdlog::info("[BridgeBuilder] Deleting connection '{}' ({})", d.id, d.uuid);
        if (auto err = inspector_.backend().delete_connection(d.uuid); !err) {
            err.user_msg = "Failed to delete connection '" + d.id + "': " + err.user_msg;
            return err;
        }
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError BridgeBuilder::add(const BridgePlan& plan, BuildReport& report) {
    std::vector<BridgeProfile> bridges;
    if (auto err = inspector_.list_bridges(bridges); !err) {
        return err;
    }

    auto existing = std::find_if(bridges.begin(), bridges.end(), [&](const BridgeProfile& b) {
        return b.profile.id == plan.conn_name || b.profile.interface_name == plan.bridge_ifname;
    });
    if (existing != bridges.end() && !plan.force) {
        return BridgeError(BridgeResult::BRIDGE_EXISTS,
                           "bridge profile " + existing->profile.uuid + " matches " +
                               plan.conn_name + "/" + plan.bridge_ifname,
                           "Bridge '" + existing->profile.id + "' (" +
                               existing->profile.interface_name +
                               ") already exists, use --force to replace it");
    }

    if (plan.force) {
        std::vector<Doomed> doomed;
        if (auto err = collect_conflicts(plan, doomed); !err) {
            return err;
        }
        if (auto err = delete_all(doomed, plan.dry_run, report); !err) {
            return err;
        }
    }

    report.bridge_uuid = generate_uuid_v4();
    report.port_uuid = generate_uuid_v4();
    report.port_conn_name = plan.port_conn_name;

    ConnectionProfile bridge = make_bridge_profile(plan, report.bridge_uuid);
    ConnectionProfile port = make_port_profile(plan, report.port_uuid, report.bridge_uuid);

    report.operations.push_back(fmt::format("Add bridge connection '{}' (ifname {}, {})", bridge.id,
                                            bridge.interface_name,
                                            describe_settings(plan.bridge)));
    report.operations.push_back(fmt::format("Add port connection '{}' (slave {}, master {})",
                                            port.id, port.interface_name, bridge.id));

    if (plan.dry_run) {
        spdlog::info("[BridgeBuilder] Dry run, {} operation(s) not applied",
                     report.operations.size());
        return BridgeError(BridgeResult::SUCCESS);
    }

    spdlog::info("[BridgeBuilder] Creating bridge profile {} ({})", bridge.id,
                 bridge.interface_name);
    if (auto err = inspector_.backend().add_connection(bridge); !err) {
        err.user_msg = "Failed to create bridge connection '" + bridge.id + "': " + err.user_msg;
        return err;
    }

    spdlog::info("[BridgeBuilder] Creating port profile {} for {}", port.id, port.interface_name);
    if (auto err = inspector_.backend().add_connection(port); !err) {
        err.user_msg = "Bridge connection '" + bridge.id + "' (" + bridge.uuid +
                       ") was created but port connection '" + port.id +
                       "' failed: " + err.user_msg + ". Delete '" + bridge.id +
                       "' by hand or rerun with --force";
        return err;
    }

    spdlog::info("[BridgeBuilder] Bridge {} created with slave {}", bridge.id,
                 plan.slave_interface);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError BridgeBuilder::remove(const std::string& name, const RunOptions& run,
                                  BuildReport& report) {
    ConnectionProfile target;
    if (auto err = inspector_.find_connection(name, target); !err) {
        return err;
    }

    std::vector<Doomed> doomed;
    if (target.is_bridge()) {
        std::vector<BridgeProfile> bridges;
        if (auto err = inspector_.list_bridges(bridges); !err) {
            return err;
        }
        for (const auto& bridge : bridges) {
            if (bridge.profile.uuid != target.uuid) {
                continue;
            }
            for (const auto& port : bridge.ports) {
                doomed.push_back({port.uuid, port.conn_id});
            }
        }
    }
    doomed.push_back({target.uuid, target.id});

    return delete_all(doomed, run.dry_run, report);
}

BridgeError BridgeBuilder::activate(const std::string& name, const RunOptions& run,
                                    BuildReport& report) {
    ConnectionProfile target;
    if (auto err = inspector_.find_connection(name, target); !err) {
        return err;
    }

    report.operations.push_back(fmt::format("Activate connection '{}' ({})", target.id,
                                            target.uuid));
    if (run.dry_run) {
        return BridgeError(BridgeResult::SUCCESS);
    }

    spdlog::info("[BridgeBuilder] Activating connection '{}'", target.id);
    if (auto err = inspector_.backend().activate_connection(target.uuid); !err) {
        if (err.result == BridgeResult::SERVICE_ERROR) {
            err.result = BridgeResult::ACTIVATION_FAILED;
        }
        err.user_msg = "Failed to activate '" + target.id + "': " + err.user_msg;
        return err;
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError BridgeBuilder::deactivate(const std::string& name, const RunOptions& run,
                                      BuildReport& report) {
    ConnectionProfile target;
    if (auto err = inspector_.find_connection(name, target); !err) {
        return err;
    }

    if (!target.active) {
        spdlog::info("[BridgeBuilder] Connection '{}' is not active, nothing to deactivate",
                     target.id);
        return BridgeError(BridgeResult::SUCCESS);
    }

    report.operations.push_back(fmt::format("Deactivate connection '{}' ({})", target.id,
                                            target.uuid));
    if (run.dry_run) {
        return BridgeError(BridgeResult::SUCCESS);
    }

    spdlog::info("[BridgeBuilder] Deactivating connection '{}'", target.id);
    if (auto err = inspector_.backend().deactivate_connection(target.uuid); !err) {
        if (err.result == BridgeResult::SERVICE_ERROR) {
            err.result = BridgeResult::ACTIVATION_FAILED;
        }
        err.user_msg = "Failed to deactivate '" + target.id + "': " + err.user_msg;
        return err;
    }
    return BridgeError(BridgeResult::SUCCESS);
}

} // namespace vbridge
