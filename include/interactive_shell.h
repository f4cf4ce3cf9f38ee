// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "command_dispatcher.h"
#include "network_inspector.h"
#include "run_options.h"

#include <ostream>
#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief Live names offered by tab-completion
 *
 * Queried on every completion attempt; implementations must not cache.
 */
class CompletionSource {
  public:
    virtual ~CompletionSource() = default;

    /// Interfaces that can be enslaved to a bridge
    virtual std::vector<std::string> device_names() = 0;

    /// Profile ids and UUIDs
    virtual std::vector<std::string> connection_names() = 0;
};

/**
 * @brief CompletionSource backed by the live NetworkManager state
 */
class InspectorCompletionSource : public CompletionSource {
  public:
    explicit InspectorCompletionSource(NetworkInspector& inspector) : inspector_(inspector) {}

    std::vector<std::string> device_names() override {
        return inspector_.slave_candidates();
    }
    std::vector<std::string> connection_names() override {
        return inspector_.connection_identifiers();
    }

  private:
    NetworkInspector& inspector_;
};

/**
 * @brief Candidate completions for the word being typed
 *
 * @param line_before Line content before the word being completed
 * @param text Partial word being completed
 * @param source Live device/connection names
 * @return Sorted candidates starting with text
 */
std::vector<std::string> complete_words(const std::string& line_before, const std::string& text,
                                        CompletionSource& source);

/**
 * @brief Read-eval loop over the dispatcher with GNU readline editing
 *
 * Processes one line completely before reading the next. Per-line errors are
 * logged and the loop continues; exit, quit or end of input stop it.
 */
class InteractiveShell {
  public:
    static constexpr const char* INTRO = "\nWelcome to the interactive virt-bridge-setup shell.\n"
                                         "Type `help` or `?` to list commands.\n";
    static constexpr const char* PROMPT = "_________________________________________\n"
                                          "virt-bridge #> ";

    InteractiveShell(CommandDispatcher& dispatcher, CompletionSource& completion,
                     const RunOptions& run, std::ostream& out);
    ~InteractiveShell();

    InteractiveShell(const InteractiveShell&) = delete;
    InteractiveShell& operator=(const InteractiveShell&) = delete;

    /**
     * @brief Run the loop until exit or end of input
     *
     * @return Process exit code (always 0)
     */
    int run();

    /**
     * @brief Tokenize, parse and dispatch one line
     *
     * @return false when the line ends the session
     */
    bool handle_line(const std::string& line);

    /// Result of the last dispatched line
    BridgeResult last_result() const {
        return last_result_;
    }

  private:
    static char** readline_completion(const char* text, int start, int end);
    static char* readline_generator(const char* text, int state);

    static InteractiveShell* active_;

    CommandDispatcher& dispatcher_;
    CompletionSource& completion_;
    const RunOptions run_;
    std::ostream& out_;
    BridgeResult last_result_ = BridgeResult::SUCCESS;
    std::vector<std::string> pending_matches_;
};

} // namespace vbridge
