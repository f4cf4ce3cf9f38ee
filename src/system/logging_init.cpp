// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace vbridge {

namespace {

constexpr const char* LOGGER_NAME = "virt-bridge-setup";

} // namespace

void init_logging(bool debug, const std::string& level_name) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_pattern(LOG_PATTERN);

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[Logging] Debug logging enabled");
        return;
    }

    auto level = spdlog::level::from_str(level_name);
    // from_str() maps unknown names to off
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("[Logging] Unknown log_level '{}', using info", level_name);
        return;
    }
    spdlog::set_level(level);
}

} // namespace vbridge
