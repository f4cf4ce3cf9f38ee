// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vbridge {

/// Pattern for every log line ("2025-06-01 12:00:00 - info - message")
constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S - %l - %v";

/**
 * @brief Install the stderr color logger as spdlog's default logger
 *
 * Safe to call more than once; the level is reapplied each time.
 *
 * @param debug Force debug level (--debug)
 * @param level_name Level from the config file ("trace" ... "off"); unknown
 *        names fall back to info with a warning
 */
void init_logging(bool debug, const std::string& level_name = "info");

} // namespace vbridge
