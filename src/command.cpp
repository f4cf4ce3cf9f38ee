// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command.h"

#include "config.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <map>

namespace vbridge {

namespace {

constexpr const char* PROGRAM_NAME = "virt-bridge-setup";

struct FlagSpec {
    std::string name;
    std::vector<std::string> aliases;
    bool takes_value;
    const char* help;
};

struct CommandSpec {
    const char* name;
    const char* args;
    const char* help;
};

// clang-format off
const std::vector<FlagSpec> ADD_FLAGS = {
    {"--conn-name", {"-cn"}, true,
     "The name for the new bridge connection profile (e.g., my-bridge)."},
    {"--bridge-ifname", {"-bn"}, true,
     "The name for the bridge network interface (e.g., br0)."},
    {"--slave-interface", {"-i"}, true,
     "The existing physical interface to enslave (e.g., eth0)."},
    {"--no-clone-mac", {"-ncm"}, false,
     "Do not set the bridge MAC address to be the same as the slave interface."},
    {"--stp", {}, true,
     "Enables or disables Spanning Tree Protocol (STP). Default: yes."},
    {"--stp-priority", {"-sp"}, true,
     "Sets the STP priority (0-65535). Lower is more preferred."},
    {"--fdelay", {}, true,
     "Sets the STP forward delay in seconds (0-30)."},
    {"--multicast-snooping", {"-ms"}, true,
     "Enables or disables IGMP/MLD snooping. Default: yes."},
    {"--vlan-filtering", {}, true,
     "Enables or disables VLAN filtering on the bridge. Default: no"},
    {"--vlan-default-pvid", {"-vdp"}, true,
     "Sets the default Port VLAN ID (1-4094) for the bridge port itself."},
    {"--no-activate", {}, false,
     "Do not activate the new port connection after creating it."},
};

const std::vector<FlagSpec> LINE_FLAGS = {
    {"--force", {"-f"}, false, "Force adding a bridge (even if one exist already)"},
    {"--dry-run", {"-dr", "-n"}, false, "Dont do anything, print the planned operations"},
};

const std::vector<FlagSpec> PROCESS_FLAGS = {
    {"--debug", {"-d"}, false, "Enable debug mode (very verbose...)"},
    {"--mock", {}, false, "Use an in-memory NetworkManager with demo devices"},
    {"--config", {"-c"}, true, "Read defaults from this JSON config file"},
    {"--help", {"-h"}, false, "Show this help and exit"},
    {"--version", {"-V"}, false, "Show the version and exit"},
};

const std::vector<CommandSpec> COMMANDS = {
    {"add", "[options]", "Add a new bridge connection."},
    {"dev", "", "Show all available network devices."},
    {"conn", "", "Show all connections."},
    {"showb", "", "Show all current bridges."},
    {"delete", "NAME", "Delete a connection (name or UUID); bridges take their ports along."},
    {"activate", "NAME", "Activate a connection (name or UUID)."},
    {"deactivate", "NAME", "Deactivate a connection (name or UUID)."},
    {"interactive", "", "Start an interactive shell session."},
    {"help", "[COMMAND]", "Show help for a command."},
};
// clang-format on

const std::map<std::string, std::string> ALIASES = {
    {"list_devices", "dev"},   {"list_connections", "conn"}, {"list_bridges", "showb"},
    {"show_bridges", "showb"}, {"quit", "exit"},             {"?", "help"},
};

BridgeError usage_error(const std::string& msg) {
    return BridgeError(BridgeResult::USAGE_ERROR, msg, msg);
}

BridgeError invalid_value(const std::string& flag, const std::string& value,
                          const std::string& expected) {
    std::string msg = fmt::format("Invalid value for {}: '{}' ({})", flag, value, expected);
    return BridgeError(BridgeResult::INVALID_PARAMETER, msg, msg);
}

const FlagSpec* find_flag(const std::vector<FlagSpec>& flags, const std::string& word) {
    for (const auto& flag : flags) {
        if (flag.name == word ||
            std::find(flag.aliases.begin(), flag.aliases.end(), word) != flag.aliases.end()) {
            return &flag;
        }
    }
    return nullptr;
}

/// Split "--flag=value" into its parts; value stays empty without '='
void split_assignment(const std::string& word, std::string& flag, std::string& value,
                      bool& has_value) {
    auto eq = word.find('=');
    has_value = word.rfind("-", 0) == 0 && eq != std::string::npos;
    flag = has_value ? word.substr(0, eq) : word;
    value = has_value ? word.substr(eq + 1) : "";
}

BridgeError parse_long(const std::string& flag, const std::string& value, std::optional<long>& out) {
    long parsed = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return invalid_value(flag, value, "expected an integer");
    }
    out = parsed;
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError parse_yes_no(const std::string& flag, const std::string& value, bool& out) {
    if (value == "yes") {
        out = true;
    } else if (value == "no") {
        out = false;
    } else {
        return invalid_value(flag, value, "choose from 'yes', 'no'");
    }
    return BridgeError(BridgeResult::SUCCESS);
}

std::string resolve_alias(const std::string& name) {
    auto it = ALIASES.find(name);
    return it == ALIASES.end() ? name : it->second;
}

bool is_known_command(const std::string& name) {
    return name == "exit" || name == "version" ||
           std::any_of(COMMANDS.begin(), COMMANDS.end(),
                       [&](const CommandSpec& c) { return name == c.name; });
}

/// Whether a command-level flag consumes the following word
bool command_flag_takes_value(const std::string& command, const std::string& word) {
    if (command != "add") {
        return false;
    }
    const FlagSpec* spec = find_flag(ADD_FLAGS, word);
    return spec && spec->takes_value;
}

BridgeError parse_add(const std::vector<std::string>& args, const CommandDefaults& defaults,
                      AddCommand& out) {
    out.options = defaults.add;
    out.activate = defaults.auto_activate;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string word, value;
        bool has_value = false;
        split_assignment(args[i], word, value, has_value);

        const FlagSpec* spec = find_flag(ADD_FLAGS, word);
        if (!spec) {
            return usage_error("add: unrecognized argument '" + args[i] + "'");
        }
        if (spec->takes_value && !has_value) {
            if (i + 1 >= args.size()) {
                return usage_error("add: " + spec->name + " expects a value");
            }
            value = args[++i];
        } else if (!spec->takes_value && has_value) {
            return usage_error("add: " + spec->name + " does not take a value");
        }

        BridgeOptions& o = out.options;
        const std::string& name = spec->name;
        BridgeError err;
        if (name == "--conn-name") {
            o.conn_name = value;
        } else if (name == "--bridge-ifname") {
            o.bridge_ifname = value;
        } else if (name == "--slave-interface") {
            o.slave_interface = value;
        } else if (name == "--no-clone-mac") {
            o.clone_mac = false;
        } else if (name == "--stp") {
            err = parse_yes_no(name, value, o.stp);
        } else if (name == "--stp-priority") {
            err = parse_long(name, value, o.stp_priority);
        } else if (name == "--fdelay") {
            err = parse_long(name, value, o.forward_delay);
        } else if (name == "--multicast-snooping") {
            err = parse_yes_no(name, value, o.multicast_snooping);
        } else if (name == "--vlan-filtering") {
            err = parse_yes_no(name, value, o.vlan_filtering);
        } else if (name == "--vlan-default-pvid") {
            err = parse_long(name, value, o.vlan_default_pvid);
        } else if (name == "--no-activate") {
            out.activate = false;
        }
        if (!err) {
            return err;
        }
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError parse_name_argument(const std::string& command, const std::vector<std::string>& args,
                                std::string& name) {
    if (args.empty()) {
        return usage_error(command + " requires a connection name or UUID.");
    }
    if (args.size() > 1) {
        return usage_error(command + ": unrecognized argument '" + args[1] +
                           "' (quote names containing spaces)");
    }
    if (args[0].rfind("-", 0) == 0) {
        return usage_error(command + ": unrecognized argument '" + args[0] + "'");
    }
    name = args[0];
    return BridgeError(BridgeResult::SUCCESS);
}

/// Build the Command for a canonical command name and its own arguments
BridgeError build_command(const std::string& command, const std::vector<std::string>& args,
                          const CommandDefaults& defaults, Command& out) {
    if (command == "add") {
        AddCommand add;
        if (auto err = parse_add(args, defaults, add); !err) {
            return err;
        }
        out = std::move(add);
        return BridgeError(BridgeResult::SUCCESS);
    }

    if (command == "delete" || command == "activate" || command == "deactivate") {
        std::string name;
        if (auto err = parse_name_argument(command, args, name); !err) {
            return err;
        }
        if (command == "delete") {
            out = DeleteCommand{name};
        } else if (command == "activate") {
            out = ActivateCommand{name};
        } else {
            out = DeactivateCommand{name};
        }
        return BridgeError(BridgeResult::SUCCESS);
    }

    if (command == "help") {
        if (args.size() > 1) {
            return usage_error("help: expected at most one command name");
        }
        out = HelpCommand{args.empty() ? "" : resolve_alias(args[0])};
        return BridgeError(BridgeResult::SUCCESS);
    }

    if (!args.empty()) {
        return usage_error(command + ": unrecognized argument '" + args[0] + "'");
    }
    if (command == "dev") {
        out = ListDevicesCommand{};
    } else if (command == "conn") {
        out = ListConnectionsCommand{};
    } else if (command == "showb") {
        out = ShowBridgesCommand{};
    } else if (command == "interactive") {
        out = InteractiveCommand{};
    } else if (command == "version") {
        out = VersionCommand{};
    } else {
        out = ExitCommand{};
    }
    return BridgeError(BridgeResult::SUCCESS);
}

} // namespace

CommandDefaults CommandDefaults::from_config(Config& config) {
    CommandDefaults d;
    d.add.conn_name = config.get<std::string>("/defaults/conn_name", d.add.conn_name);
    d.add.bridge_ifname = config.get<std::string>("/defaults/bridge_ifname", d.add.bridge_ifname);
    d.add.stp = config.get<bool>("/defaults/stp", d.add.stp);
    d.add.multicast_snooping =
        config.get<bool>("/defaults/multicast_snooping", d.add.multicast_snooping);
    d.add.vlan_filtering = config.get<bool>("/defaults/vlan_filtering", d.add.vlan_filtering);
    d.add.clone_mac = config.get<bool>("/defaults/clone_mac", d.add.clone_mac);
    d.auto_activate = config.get<bool>("/defaults/auto_activate", d.auto_activate);
    return d;
}

BridgeError tokenize(const std::string& line, std::vector<std::string>& words) {
    words.clear();
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (c == '\\' && i + 1 < line.size()) {
            current += line[++i];
            in_word = true;
        } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }

    if (quote) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, "unterminated quote in: " + line,
                           std::string("Unterminated ") + quote + " quote");
    }
    if (in_word) {
        words.push_back(current);
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError parse_command_line(const std::vector<std::string>& args,
                               const CommandDefaults& defaults, Invocation& out) {
    if (args.empty()) {
        return usage_error("No command given");
    }

    Invocation result;
    std::string command;
    std::vector<std::string> command_args;
    bool want_help = false;
    bool want_version = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!command.empty() && command_flag_takes_value(command, arg)) {
            command_args.push_back(arg);
            if (i + 1 < args.size()) {
                command_args.push_back(args[++i]);
            }
            continue;
        }

        std::string word, value;
        bool has_value = false;
        split_assignment(arg, word, value, has_value);

        if (const FlagSpec* spec = find_flag(LINE_FLAGS, word)) {
            if (has_value) {
                return usage_error(spec->name + " does not take a value");
            }
            (spec->name == "--force" ? result.run.force : result.run.dry_run) = true;
            continue;
        }
        if (const FlagSpec* spec = find_flag(PROCESS_FLAGS, word)) {
            if (spec->name == "--config") {
                if (!has_value) {
                    if (i + 1 >= args.size()) {
                        return usage_error("--config expects a path");
                    }
                    value = args[++i];
                }
                result.run.config_path = value;
            } else if (has_value) {
                return usage_error(spec->name + " does not take a value");
            } else if (spec->name == "--debug") {
                result.run.debug = true;
            } else if (spec->name == "--mock") {
                result.run.mock = true;
            } else if (spec->name == "--help") {
                want_help = true;
            } else {
                want_version = true;
            }
            continue;
        }

        if (command.empty()) {
            if (arg.rfind("-", 0) == 0) {
                return usage_error("Unrecognized option '" + arg + "'");
            }
            command = resolve_alias(arg);
            if (!is_known_command(command) || command == "exit" || command == "version") {
                return usage_error("Unknown command '" + arg + "'");
            }
            continue;
        }
        command_args.push_back(arg);
    }

    if (want_version) {
        result.command = VersionCommand{};
    } else if (want_help) {
        result.command = HelpCommand{command};
    } else if (command.empty()) {
        return usage_error("No command given");
    } else if (auto err = build_command(command, command_args, defaults, result.command); !err) {
        return err;
    }

    out = std::move(result);
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError parse_shell_line(const std::vector<std::string>& words,
                             const CommandDefaults& defaults, ShellLine& out) {
    if (words.empty()) {
        return usage_error("Empty command");
    }

    std::string command = resolve_alias(words[0]);
    if (!is_known_command(command) || command == "version") {
        return usage_error("Unknown command '" + words[0] + "'. Type `help` to list commands.");
    }
    if (command == "interactive") {
        return usage_error("Already in the interactive shell");
    }

    ShellLine result;
    std::vector<std::string> command_args;
    bool want_help = false;

    for (size_t i = 1; i < words.size(); ++i) {
        const std::string& word = words[i];
        if (command_flag_takes_value(command, word)) {
            command_args.push_back(word);
            if (i + 1 < words.size()) {
                command_args.push_back(words[++i]);
            }
            continue;
        }
        if (const FlagSpec* spec = find_flag(LINE_FLAGS, word)) {
            (spec->name == "--force" ? result.force : result.dry_run) = true;
            continue;
        }
        if (word == "-h" || word == "--help") {
            want_help = true;
            continue;
        }
        command_args.push_back(word);
    }

    if (want_help) {
        result.command = HelpCommand{command};
    } else if (auto err = build_command(command, command_args, defaults, result.command); !err) {
        return err;
    }

    out = std::move(result);
    return BridgeError(BridgeResult::SUCCESS);
}

// ============================================================================
// Command metadata
// ============================================================================

const std::vector<std::string>& shell_command_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& c : COMMANDS) {
            if (std::string(c.name) != "interactive") {
                v.push_back(c.name);
            }
        }
        for (const auto& [alias, target] : ALIASES) {
            if (alias != "?") {
                v.push_back(alias);
            }
        }
        v.push_back("exit");
        std::sort(v.begin(), v.end());
        return v;
    }();
    return names;
}

std::vector<std::string> command_flags(const std::string& command) {
    std::string canonical = resolve_alias(command);
    std::vector<std::string> flags;
    if (canonical == "add") {
        for (const auto& f : ADD_FLAGS) {
            flags.push_back(f.name);
        }
    }
    if (canonical == "add" || canonical == "delete" || canonical == "activate" ||
        canonical == "deactivate") {
        for (const auto& f : LINE_FLAGS) {
            flags.push_back(f.name);
        }
    }
    return flags;
}

bool flag_takes_value(const std::string& flag) {
    const FlagSpec* spec = find_flag(ADD_FLAGS, flag);
    if (!spec) {
        spec = find_flag(PROCESS_FLAGS, flag);
    }
    return spec && spec->takes_value;
}

namespace {

std::string format_flag_line(const FlagSpec& flag) {
    std::string names;
    for (const auto& alias : flag.aliases) {
        names += alias + ", ";
    }
    names += flag.name;
    if (flag.takes_value) {
        names += " VALUE";
    }
    return fmt::format("  {:<32} {}\n", names, flag.help);
}

} // namespace

std::string usage_text() {
    std::string out = fmt::format(
        "usage: {} [-h] [-V] [-f] [-dr] [-d] [--mock] [-c PATH] COMMAND [ARGS]\n\n", PROGRAM_NAME);
    out += "Manage Bridge connections.\n\nCommands:\n";
    for (const auto& c : COMMANDS) {
        out += fmt::format("  {:<14} {}\n", c.name, c.help);
    }
    out += "\nOptions:\n";
    for (const auto& f : LINE_FLAGS) {
        out += format_flag_line(f);
    }
    for (const auto& f : PROCESS_FLAGS) {
        out += format_flag_line(f);
    }
    out += fmt::format("\nRun '{} help add' for the bridge options.\n", PROGRAM_NAME);
    return out;
}

std::string help_text(const std::string& topic) {
    if (topic.empty()) {
        std::string out = "Documented commands (type help <topic>):\n";
        for (const auto& c : COMMANDS) {
            if (std::string(c.name) == "interactive") {
                continue;
            }
            out += fmt::format("  {:<14} {}\n", c.name, c.help);
        }
        out += fmt::format("  {:<14} {}\n", "exit", "Exit the interactive shell (also: quit).");
        return out;
    }

    std::string name = resolve_alias(topic);
    auto it = std::find_if(COMMANDS.begin(), COMMANDS.end(),
                           [&](const CommandSpec& c) { return name == c.name; });
    if (it == COMMANDS.end()) {
        if (name == "exit") {
            return "exit\n  Exit the interactive shell (also: quit).\n";
        }
        return "*** No help on " + topic + "\n";
    }

    std::string out = fmt::format("usage: {}{}{}\n  {}\n", it->name, *it->args ? " " : "",
                                  it->args, it->help);
    if (name == "add") {
        out += "\nOptions:\n";
        for (const auto& f : ADD_FLAGS) {
            out += format_flag_line(f);
        }
    }
    if (name == "add" || name == "delete" || name == "activate" || name == "deactivate") {
        for (const auto& f : LINE_FLAGS) {
            out += format_flag_line(f);
        }
    }
    return out;
}

} // namespace vbridge
