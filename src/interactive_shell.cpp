// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interactive_shell.h"

#include "command.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <readline/history.h>
#include <readline/readline.h>

namespace vbridge {

namespace {

// No '-' here: flag names complete as one word
char word_break_characters[] = " \t\n\"'";
char quote_characters[] = "\"'";

struct FreeDeleter {
    void operator()(char* p) const {
        free(p);
    }
};
using line_ptr = std::unique_ptr<char, FreeDeleter>;

const std::vector<std::string> YES_NO = {"yes", "no"};

bool is_yes_no_flag(const std::string& flag) {
    return flag == "--stp" || flag == "--multicast-snooping" || flag == "-ms" ||
           flag == "--vlan-filtering";
}

bool takes_connection_name(const std::string& command) {
    return command == "delete" || command == "activate" || command == "deactivate";
}

std::vector<std::string> filter_prefix(std::vector<std::string> candidates,
                                       const std::string& text) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const std::string& c) { return c.rfind(text, 0) != 0; }),
                     candidates.end());
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    return candidates;
}

} // namespace

std::vector<std::string> complete_words(const std::string& line_before, const std::string& text,
                                        CompletionSource& source) {
    std::vector<std::string> words;
    if (!tokenize(line_before, words)) {
        return {};
    }

    if (words.empty()) {
        return filter_prefix(shell_command_names(), text);
    }

    const std::string& command = words.front();
    const std::string& previous = words.back();

    if (words.size() > 1 && (previous == "--slave-interface" || previous == "-i")) {
        return filter_prefix(source.device_names(), text);
    }
    if (words.size() > 1 && is_yes_no_flag(previous)) {
        return filter_prefix(YES_NO, text);
    }
    if (words.size() > 1 && flag_takes_value(previous)) {
        return {};
    }

    if (!text.empty() && text[0] == '-') {
        return filter_prefix(command_flags(command), text);
    }

    if (takes_connection_name(command)) {
        bool has_name = std::any_of(words.begin() + 1, words.end(),
                                    [](const std::string& w) { return w.rfind("-", 0) != 0; });
        if (!has_name) {
            return filter_prefix(source.connection_names(), text);
        }
        return {};
    }

    if (command == "help" || command == "?") {
        return words.size() == 1 ? filter_prefix(shell_command_names(), text)
                                 : std::vector<std::string>{};
    }

    return filter_prefix(command_flags(command), text);
}

// ============================================================================
// InteractiveShell
// ============================================================================

InteractiveShell* InteractiveShell::active_ = nullptr;

InteractiveShell::InteractiveShell(CommandDispatcher& dispatcher, CompletionSource& completion,
                                   const RunOptions& run, std::ostream& out)
    : dispatcher_(dispatcher), completion_(completion), run_(run), out_(out) {
    dispatcher_.set_interactive(true);
}

InteractiveShell::~InteractiveShell() {
    if (active_ == this) {
        active_ = nullptr;
        rl_attempted_completion_function = nullptr;
    }
    dispatcher_.set_interactive(false);
}

bool InteractiveShell::handle_line(const std::string& line) {
    std::vector<std::string> words;
    if (auto err = tokenize(line, words); !err) {
        last_result_ = err.result;
        log_command_error(err);
        return true;
    }
    if (words.empty()) {
        return true;
    }

    ShellLine parsed;
    if (auto err = parse_shell_line(words, dispatcher_.defaults(), parsed); !err) {
        last_result_ = err.result;
        log_command_error(err);
        return true;
    }

    if (std::holds_alternative<ExitCommand>(parsed.command)) {
        out_ << "Goodbye!\n";
        out_.flush();
        last_result_ = BridgeResult::SUCCESS;
        return false;
    }

    RunOptions line_run = run_.merged(parsed.force, parsed.dry_run);
    BridgeError err = dispatcher_.execute(parsed.command, line_run);
    last_result_ = err.result;
    if (!err) {
        log_command_error(err);
    }
    out_.flush();
    return true;
}

int InteractiveShell::run() {
    active_ = this;
    rl_readline_name = "virt-bridge-setup";
    rl_attempted_completion_function = readline_completion;
    rl_completer_word_break_characters = word_break_characters;
    rl_completer_quote_characters = quote_characters;

    out_ << INTRO;
    out_.flush();

    spdlog::debug("[Shell] Interactive session started (force={} dry_run={})", run_.force,
                  run_.dry_run);

    while (true) {
        line_ptr line(readline(PROMPT));
        if (!line) {
            out_ << "\n";
            break;
        }
        if (*line.get() != '\0') {
            add_history(line.get());
        }
        if (!handle_line(line.get())) {
            break;
        }
    }

    spdlog::debug("[Shell] Interactive session ended");
    return 0;
}

char** InteractiveShell::readline_completion(const char* text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;
    if (!active_) {
        return nullptr;
    }

    std::string before(rl_line_buffer, static_cast<size_t>(start));
    // Drop an opening quote readline left in front of the word
    if (!before.empty() && (before.back() == '"' || before.back() == '\'')) {
        before.pop_back();
    }
    active_->pending_matches_ = complete_words(before, text, active_->completion_);
    return rl_completion_matches(text, readline_generator);
}

char* InteractiveShell::readline_generator(const char* /*text*/, int state) {
    static size_t index = 0;
    if (state == 0) {
        index = 0;
    }
    if (!active_ || index >= active_->pending_matches_.size()) {
        return nullptr;
    }
    return strdup(active_->pending_matches_[index++].c_str());
}

} // namespace vbridge
