// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_dispatcher.h"

#include "vbridge_version.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <variant>

namespace vbridge {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

CommandDispatcher::CommandDispatcher(NmBackend& backend, const CommandDefaults& defaults,
                                     std::vector<std::string> ignored_prefixes, std::ostream& out)
    : inspector_(backend, std::move(ignored_prefixes)), planner_(inspector_), builder_(inspector_),
      defaults_(defaults), out_(out) {}

BridgeError CommandDispatcher::execute(const Command& command, const RunOptions& run) {
    return std::visit(
        overloaded{
            [&](const AddCommand& cmd) { return run_add(cmd, run); },
            [&](const ListDevicesCommand&) { return run_list_devices(); },
            [&](const ListConnectionsCommand&) { return run_list_connections(); },
            [&](const ShowBridgesCommand&) { return run_show_bridges(); },
            [&](const DeleteCommand& cmd) { return run_delete(cmd, run); },
            [&](const ActivateCommand& cmd) { return run_activate(cmd, run); },
            [&](const DeactivateCommand& cmd) { return run_deactivate(cmd, run); },
            [&](const InteractiveCommand&) {
                return BridgeError(BridgeResult::USAGE_ERROR, "nested interactive command",
                                   "Already in the interactive shell");
            },
            [&](const HelpCommand& cmd) { return run_help(cmd); },
            [&](const VersionCommand&) { return run_version(); },
            [&](const ExitCommand&) { return BridgeError(BridgeResult::SUCCESS); },
        },
        command);
}

void CommandDispatcher::print_operations(const BuildReport& report) {
    out_ << "Dry run, the following operations would be performed:\n";
    for (size_t i = 0; i < report.operations.size(); ++i) {
        out_ << "  " << (i + 1) << ". " << report.operations[i] << "\n";
    }
    out_.flush();
}

void CommandDispatcher::print_known_connections() {
    std::vector<ConnectionProfile> connections;
    if (inspector_.list_connections(connections)) {
        out_ << "Known connections:\n" << format_connection_table(connections);
    }
}

BridgeError CommandDispatcher::run_add(const AddCommand& cmd, const RunOptions& run) {
    BridgePlan plan;
    if (auto err = planner_.plan(cmd.options, run, plan); !err) {
        if (err.result == BridgeResult::INTERFACE_NOT_FOUND) {
            std::vector<Device> devices;
            if (inspector_.list_devices(devices)) {
                out_ << format_device_table(devices);
            }
        }
        return err;
    }

    BuildReport report;
    if (auto err = builder_.add(plan, report); !err) {
        if (err.result == BridgeResult::BRIDGE_EXISTS) {
            std::vector<BridgeProfile> bridges;
            if (inspector_.list_bridges(bridges)) {
                out_ << format_bridge_report(bridges);
            }
        }
        return err;
    }

    if (plan.dry_run) {
        if (cmd.activate) {
            report.operations.push_back("Activate connection '" + report.port_conn_name + "'");
        }
        print_operations(report);
        return BridgeError(BridgeResult::SUCCESS);
    }

    out_ << "Bridge connection '" << plan.conn_name << "' (" << plan.bridge_ifname
         << ") created with port '" << report.port_conn_name << "' on " << plan.slave_interface
         << ".\n";

    if (!cmd.activate) {
        spdlog::info("[Dispatcher] Not activating {}; run 'activate {}' to bring it up",
                     report.port_conn_name, report.port_conn_name);
        return BridgeError(BridgeResult::SUCCESS);
    }

    BuildReport activation;
    if (auto err = builder_.activate(report.port_uuid, run, activation); !err) {
        return err;
    }
    out_ << "Connection '" << report.port_conn_name << "' activated.\n";
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_list_devices() {
    std::vector<Device> devices;
    if (auto err = inspector_.list_devices(devices); !err) {
        return err;
    }
    out_ << format_device_table(devices);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_list_connections() {
    std::vector<ConnectionProfile> connections;
    if (auto err = inspector_.list_connections(connections); !err) {
        return err;
    }
    out_ << format_connection_table(connections);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_show_bridges() {
    std::vector<BridgeProfile> bridges;
    if (auto err = inspector_.list_bridges(bridges); !err) {
        return err;
    }
    out_ << format_bridge_report(bridges);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_delete(const DeleteCommand& cmd, const RunOptions& run) {
    BuildReport report;
    if (auto err = builder_.remove(cmd.name, run, report); !err) {
        if (err.result == BridgeResult::CONNECTION_NOT_FOUND) {
            print_known_connections();
        }
        return err;
    }
    if (run.dry_run) {
        print_operations(report);
    } else {
        out_ << "Connection '" << cmd.name << "' deleted.\n";
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_activate(const ActivateCommand& cmd, const RunOptions& run) {
    BuildReport report;
    if (auto err = builder_.activate(cmd.name, run, report); !err) {
        if (err.result == BridgeResult::CONNECTION_NOT_FOUND) {
            print_known_connections();
        }
        return err;
    }
    if (run.dry_run) {
        print_operations(report);
    } else {
        out_ << "Connection '" << cmd.name << "' activated.\n";
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_deactivate(const DeactivateCommand& cmd,
                                              const RunOptions& run) {
    BuildReport report;
    if (auto err = builder_.deactivate(cmd.name, run, report); !err) {
        if (err.result == BridgeResult::CONNECTION_NOT_FOUND) {
            print_known_connections();
        }
        return err;
    }
    if (report.operations.empty()) {
        out_ << "Connection '" << cmd.name << "' is not active.\n";
    } else if (run.dry_run) {
        print_operations(report);
    } else {
        out_ << "Connection '" << cmd.name << "' deactivated.\n";
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_help(const HelpCommand& cmd) {
    if (cmd.topic.empty() && !interactive_) {
        out_ << usage_text();
    } else {
        out_ << help_text(cmd.topic);
    }
    if (cmd.topic == "add") {
        const BridgeOptions& d = defaults_.add;
        out_ << "\nDefaults: --conn-name " << d.conn_name << " --bridge-ifname " << d.bridge_ifname
             << " --stp " << (d.stp ? "yes" : "no") << " --multicast-snooping "
             << (d.multicast_snooping ? "yes" : "no") << " --vlan-filtering "
             << (d.vlan_filtering ? "yes" : "no") << (d.clone_mac ? "" : " --no-clone-mac")
             << (defaults_.auto_activate ? "" : " --no-activate") << "\n";
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError CommandDispatcher::run_version() {
    out_ << "virt-bridge-setup " << vbridge_version_full() << "\n";
    return BridgeError(BridgeResult::SUCCESS);
}

int exit_code_for(const BridgeError& err) {
    if (err.success()) {
        return EXIT_SUCCESS;
    }
    return err.result == BridgeResult::USAGE_ERROR ? EXIT_USAGE : EXIT_FAILURE;
}

void log_command_error(const BridgeError& err) {
    if (!err.technical_msg.empty() && err.technical_msg != err.user_msg) {
        spdlog::debug("[Dispatcher] {}: {}", result_name(err.result), err.technical_msg);
    }
    spdlog::error("{}", err.user_msg.empty() ? result_name(err.result) : err.user_msg);
}

} // namespace vbridge
