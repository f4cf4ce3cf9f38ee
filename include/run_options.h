// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vbridge {

/**
 * @brief Process-wide flags for one command execution
 *
 * Built once from the command line and passed by const reference to the
 * dispatcher, planner and builder. The interactive shell derives a fresh
 * value per line with merged() instead of mutating the startup one.
 */
struct RunOptions {
    bool force = false;      ///< Replace existing bridges/ports instead of failing
    bool dry_run = false;    ///< Validate and print operations, never mutate
    bool debug = false;      ///< Verbose logging
    bool mock = false;       ///< Use the in-memory NetworkManager backend
    std::string config_path; ///< Explicit --config value, empty for default

    /**
     * @brief Copy with per-line --force/--dry-run OR-ed in
     */
    RunOptions merged(bool line_force, bool line_dry_run) const {
        RunOptions copy = *this;
        copy.force = force || line_force;
        copy.dry_run = dry_run || line_dry_run;
        return copy;
    }
};

} // namespace vbridge
