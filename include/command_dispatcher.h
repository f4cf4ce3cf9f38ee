// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_builder.h"
#include "bridge_planner.h"
#include "command.h"
#include "network_inspector.h"
#include "run_options.h"

#include <ostream>
#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief Routes parsed commands to the inspector, planner and builder
 *
 * Holds no state between commands apart from its collaborators. Reports
 * (tables, bridge tree, planned operations) are written to the output
 * stream; failures are returned for the caller to log.
 */
class CommandDispatcher {
  public:
    /**
     * @param backend Started backend; must outlive the dispatcher
     * @param defaults Defaults used by the caller's parser, kept for help output
     * @param ignored_prefixes Interfaces never selected as slaves
     * @param out Stream for human-readable reports
     */
    CommandDispatcher(NmBackend& backend, const CommandDefaults& defaults,
                      std::vector<std::string> ignored_prefixes, std::ostream& out);

    /**
     * @brief Run one command
     *
     * InteractiveCommand is rejected here; the caller starts the shell.
     * ExitCommand is a no-op.
     */
    BridgeError execute(const Command& command, const RunOptions& run);

    /// Interactive mode prints the shell's command list for a bare `help`
    void set_interactive(bool interactive) {
        interactive_ = interactive;
    }

    NetworkInspector& inspector() {
        return inspector_;
    }

    const CommandDefaults& defaults() const {
        return defaults_;
    }

  private:
    BridgeError run_add(const AddCommand& cmd, const RunOptions& run);
    BridgeError run_list_devices();
    BridgeError run_list_connections();
    BridgeError run_show_bridges();
    BridgeError run_delete(const DeleteCommand& cmd, const RunOptions& run);
    BridgeError run_activate(const ActivateCommand& cmd, const RunOptions& run);
    BridgeError run_deactivate(const DeactivateCommand& cmd, const RunOptions& run);
    BridgeError run_help(const HelpCommand& cmd);
    BridgeError run_version();

    void print_operations(const BuildReport& report);
    /// Connection table shown when a named profile does not exist
    void print_known_connections();

    NetworkInspector inspector_;
    BridgePlanner planner_;
    BridgeBuilder builder_;
    CommandDefaults defaults_;
    std::ostream& out_;
    bool interactive_ = false;
};

/// argparse-compatible exit status for command line mistakes
constexpr int EXIT_USAGE = 2;

/**
 * @brief Process exit status for a command result
 *
 * 0 on success, EXIT_USAGE for command line mistakes, 1 for everything else.
 */
int exit_code_for(const BridgeError& err);

/**
 * @brief Log a failed command: user message at error, details at debug
 */
void log_command_error(const BridgeError& err);

} // namespace vbridge
