// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interactive_shell.h"

#include "nm_backend_mock.h"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

namespace {

/// Fixed names; counts queries to prove completion never caches
class FakeCompletionSource : public CompletionSource {
  public:
    std::vector<std::string> devices = {"eth1", "eth0", "wlan0"};
    std::vector<std::string> connections = {"c-mybr0", "Wired connection 1"};
    int queries = 0;

    std::vector<std::string> device_names() override {
        ++queries;
        return devices;
    }
    std::vector<std::string> connection_names() override {
        ++queries;
        return connections;
    }
};

using Words = std::vector<std::string>;

} // namespace

TEST_CASE("Completion of command names", "[shell][completion]") {
    FakeCompletionSource source;

    REQUIRE(complete_words("", "de", source) == Words{"deactivate", "delete", "dev"});
    REQUIRE(complete_words("", "del", source) == Words{"delete"});
    REQUIRE(complete_words("", "list_", source) ==
            Words{"list_bridges", "list_connections", "list_devices"});
    REQUIRE(complete_words("", "inter", source).empty());
    REQUIRE(complete_words("help ", "sh", source) == Words{"show_bridges", "showb"});
    REQUIRE(complete_words("help add ", "", source).empty());
}

TEST_CASE("Completion of add options", "[shell][completion]") {
    FakeCompletionSource source;

    SECTION("flags") {
        REQUIRE(complete_words("add ", "--s", source) ==
                Words{"--slave-interface", "--stp", "--stp-priority"});
        REQUIRE(complete_words("add -i eth0 ", "--d", source) == Words{"--dry-run"});
    }

    SECTION("slave interface values come from the live source") {
        REQUIRE(complete_words("add --slave-interface ", "", source) ==
                Words{"eth0", "eth1", "wlan0"});
        REQUIRE(complete_words("add -i ", "w", source) == Words{"wlan0"});

        source.devices.push_back("eth2");
        REQUIRE(complete_words("add -i ", "eth", source) == Words{"eth0", "eth1", "eth2"});
        REQUIRE(source.queries == 3);
    }

    SECTION("yes/no values") {
        REQUIRE(complete_words("add --stp ", "", source) == Words{"no", "yes"});
        REQUIRE(complete_words("add -ms ", "y", source) == Words{"yes"});
        REQUIRE(complete_words("add --vlan-filtering ", "n", source) == Words{"no"});
    }

    SECTION("free-form values offer nothing") {
        REQUIRE(complete_words("add --stp-priority ", "", source).empty());
        REQUIRE(complete_words("add -cn ", "", source).empty());
    }
}

TEST_CASE("Completion of connection names", "[shell][completion]") {
    FakeCompletionSource source;

    REQUIRE(complete_words("delete ", "", source) == Words{"Wired connection 1", "c-mybr0"});
    REQUIRE(complete_words("activate ", "c-", source) == Words{"c-mybr0"});
    REQUIRE(complete_words("deactivate -f ", "W", source) == Words{"Wired connection 1"});
    REQUIRE(complete_words("delete c-mybr0 ", "", source).empty());
    REQUIRE(complete_words("delete ", "--f", source) == Words{"--force"});
    REQUIRE(complete_words("dev ", "", source).empty());
}

// ============================================================================
// Line handling
// ============================================================================

namespace vbridge {

class ShellTestFixture {
  protected:
    NmBackendMock backend;
    std::ostringstream out;
    CommandDispatcher dispatcher{backend, CommandDefaults(), {"lo", "virbr"}, out};
    FakeCompletionSource source;
    RunOptions run;

    ShellTestFixture() {
        backend.add_demo_devices();
        backend.start();
    }
};

} // namespace vbridge

TEST_CASE_METHOD(ShellTestFixture, "Shell handles lines", "[shell]") {
    InteractiveShell shell(dispatcher, source, run, out);

    SECTION("blank lines are ignored") {
        REQUIRE(shell.handle_line(""));
        REQUIRE(shell.handle_line("   "));
        REQUIRE(out.str().empty());
    }

    SECTION("exit and quit end the session") {
        REQUIRE_FALSE(shell.handle_line("exit"));
        REQUIRE(out.str() == "Goodbye!\n");
        REQUIRE_FALSE(shell.handle_line("quit"));
    }

    SECTION("errors keep the session alive") {
        REQUIRE(shell.handle_line("frobnicate"));
        REQUIRE(shell.last_result() == BridgeResult::USAGE_ERROR);
        REQUIRE(shell.handle_line("delete \"unterminated"));
        REQUIRE(shell.last_result() == BridgeResult::INVALID_PARAMETER);
        REQUIRE(shell.handle_line("delete nope"));
        REQUIRE(shell.last_result() == BridgeResult::CONNECTION_NOT_FOUND);
        REQUIRE(shell.handle_line("interactive"));
        REQUIRE(shell.last_result() == BridgeResult::USAGE_ERROR);

        REQUIRE(shell.handle_line("dev"));
        REQUIRE(shell.last_result() == BridgeResult::SUCCESS);
    }

    SECTION("bare help lists shell commands") {
        REQUIRE(shell.handle_line("help"));
        REQUIRE(out.str().rfind("Documented commands (type help <topic>):", 0) == 0);
    }

    SECTION("per-line dry run does not stick") {
        int mutations = backend.mutation_count();
        REQUIRE(shell.handle_line("add -dr"));
        REQUIRE(backend.mutation_count() == mutations);
        REQUIRE(out.str().find("Dry run") != std::string::npos);

        REQUIRE(shell.handle_line("add --no-activate"));
        REQUIRE(backend.mutation_count() == mutations + 2);
    }

    SECTION("per-line force does not stick") {
        REQUIRE(shell.handle_line("add --no-activate"));
        REQUIRE(shell.handle_line("add --no-activate -f"));
        REQUIRE(shell.last_result() == BridgeResult::SUCCESS);
        REQUIRE(shell.handle_line("add --no-activate"));
        REQUIRE(shell.last_result() == BridgeResult::BRIDGE_EXISTS);
    }
}

TEST_CASE_METHOD(ShellTestFixture, "Shell inherits process-wide dry run", "[shell]") {
    run.dry_run = true;
    InteractiveShell shell(dispatcher, source, run, out);

    int mutations = backend.mutation_count();
    REQUIRE(shell.handle_line("add"));
    REQUIRE(shell.handle_line("delete \"Wired connection 1\""));
    REQUIRE(backend.mutation_count() == mutations);
}
