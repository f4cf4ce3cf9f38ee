// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "bridge_planner.h"
#include "run_options.h"

#include <string>
#include <variant>
#include <vector>

namespace vbridge {

class Config;

// ============================================================================
// Commands
// ============================================================================

struct AddCommand {
    BridgeOptions options;
    bool activate = true; ///< Activate the port profile after a real add
};

struct ListDevicesCommand {};
struct ListConnectionsCommand {};
struct ShowBridgesCommand {};

struct DeleteCommand {
    std::string name; ///< Profile id or UUID
};

struct ActivateCommand {
    std::string name;
};

struct DeactivateCommand {
    std::string name;
};

struct InteractiveCommand {};

struct HelpCommand {
    std::string topic; ///< Command name, empty for the overview
};

struct VersionCommand {};

/// Leaves the interactive shell (exit, quit)
struct ExitCommand {};

/**
 * @brief One parsed subcommand
 *
 * Handlers are selected with std::visit, so every alternative must be handled
 * wherever a Command is dispatched.
 */
using Command =
    std::variant<AddCommand, ListDevicesCommand, ListConnectionsCommand, ShowBridgesCommand,
                 DeleteCommand, ActivateCommand, DeactivateCommand, InteractiveCommand,
                 HelpCommand, VersionCommand, ExitCommand>;

/**
 * @brief Defaults applied to a bare add, taken from the config file
 */
struct CommandDefaults {
    BridgeOptions add;
    bool auto_activate = true;

    static CommandDefaults from_config(Config& config);
};

/**
 * @brief Command line parsed into process-wide flags and one command
 */
struct Invocation {
    RunOptions run;
    Command command;
};

/**
 * @brief One interactive shell line parsed into a command and per-line flags
 */
struct ShellLine {
    Command command;
    bool force = false;
    bool dry_run = false;
};

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Split a line into words honoring single and double quotes
 *
 * Backslash escapes the next character outside single quotes.
 *
 * @return INVALID_PARAMETER on an unterminated quote
 */
BridgeError tokenize(const std::string& line, std::vector<std::string>& words);

/**
 * @brief Parse process arguments (without argv[0])
 *
 * Global flags may appear before or after the subcommand.
 *
 * @return USAGE_ERROR for unknown commands/flags or missing values,
 *         INVALID_PARAMETER for malformed values
 */
BridgeError parse_command_line(const std::vector<std::string>& args,
                               const CommandDefaults& defaults, Invocation& out);

/**
 * @brief Parse one tokenized shell line
 *
 * Accepts --force and --dry-run anywhere on the line. The process-wide flags
 * (--mock, --config, --debug) and the interactive command are not accepted.
 */
BridgeError parse_shell_line(const std::vector<std::string>& words,
                             const CommandDefaults& defaults, ShellLine& out);

// ============================================================================
// Command metadata (help and completion)
// ============================================================================

/// Canonical command names and aliases accepted by the shell
const std::vector<std::string>& shell_command_names();

/// Long and short flags accepted by a command (empty for unknown commands)
std::vector<std::string> command_flags(const std::string& command);

/// Whether a flag consumes the following word as its value
bool flag_takes_value(const std::string& flag);

/// Usage text for the command line tool
std::string usage_text();

/// Help for one command, or the command overview when topic is empty
std::string help_text(const std::string& topic);

} // namespace vbridge
