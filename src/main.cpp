// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief virt-bridge-setup entry point
 *
 * Parses the command line, loads the config, connects to NetworkManager and
 * hands the command to the dispatcher (or the interactive shell).
 */

#include "command.h"
#include "command_dispatcher.h"
#include "config.h"
#include "interactive_shell.h"
#include "logging_init.h"
#include "nm_backend.h"
#include "vbridge_version.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace vbridge;

namespace {

// Log to stderr using only async-signal-safe-ish functions.
// spdlog may not be initialized yet or may be in a broken state.
void log_fatal(const char* msg) {
    fprintf(stderr, "[FATAL] %s\n", msg);
    fflush(stderr);
}

// Called by std::terminate() for uncaught exceptions and other fatal C++
// runtime errors. Logs what we can before aborting.
void terminate_handler() {
    // Guard against re-entrance (e.g. exception::what() throws)
    static bool entered = false;
    if (entered) {
        abort();
    }
    entered = true;

    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            fprintf(stderr, "[FATAL] Uncaught exception: %s\n", e.what());
            fflush(stderr);
        } catch (...) {
            log_fatal("Uncaught non-std::exception");
        }
    } else {
        log_fatal("std::terminate() called without active exception");
    }
    abort();
}

int report_parse_error(const BridgeError& err) {
    log_command_error(err);
    if (err.result == BridgeResult::USAGE_ERROR) {
        fprintf(stderr, "Run 'virt-bridge-setup --help' for usage.\n");
    }
    return exit_code_for(err);
}

int run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        fputs(usage_text().c_str(), stderr);
        return EXIT_FAILURE;
    }

    init_logging(false);

    // First pass only locates --config and --debug; defaults come from the config
    Invocation invocation;
    if (auto err = parse_command_line(args, CommandDefaults{}, invocation); !err) {
        return report_parse_error(err);
    }

    Config config;
    std::string config_path = Config::resolve_path(invocation.run.config_path);
    if (auto err = config.init(config_path); !err) {
        log_command_error(err);
        return EXIT_FAILURE;
    }
    init_logging(invocation.run.debug, config.get<std::string>("/log_level", "info"));
    spdlog::debug("[Main] virt-bridge-setup {} (config {})", vbridge_version_full(),
                  config.get_path());

    CommandDefaults defaults = CommandDefaults::from_config(config);
    if (auto err = parse_command_line(args, defaults, invocation); !err) {
        return report_parse_error(err);
    }
    const RunOptions& options = invocation.run;

    auto backend = NmBackend::create(options.mock);
    CommandDispatcher dispatcher(*backend, defaults, config.ignored_prefixes(), std::cout);

    bool needs_service = !std::holds_alternative<HelpCommand>(invocation.command) &&
                         !std::holds_alternative<VersionCommand>(invocation.command);
    if (needs_service) {
        if (auto err = backend->start(); !err) {
            log_command_error(err);
            return EXIT_FAILURE;
        }
    }

    if (std::holds_alternative<InteractiveCommand>(invocation.command)) {
        InspectorCompletionSource completion(dispatcher.inspector());
        InteractiveShell shell(dispatcher, completion, options, std::cout);
        return shell.run();
    }

    if (auto err = dispatcher.execute(invocation.command, options); !err) {
        log_command_error(err);
        return exit_code_for(err);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    std::set_terminate(terminate_handler);

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] Unhandled exception: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
