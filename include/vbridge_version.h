// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file vbridge_version.h
 * @brief virt-bridge-setup version information
 *
 * The version is defined in the VERSION file at the project root
 * and passed via -DVBRIDGE_VERSION during compilation.
 */

#include <cstdio>

// Version is defined by CMakeLists.txt from VERSION file
// Fallback if not defined (e.g., IDE parsing)
#ifndef VBRIDGE_VERSION
#define VBRIDGE_VERSION "dev"
#endif

// Git commit hash (short), defined by CMakeLists.txt when building from a checkout
#ifndef VBRIDGE_GIT_HASH
#define VBRIDGE_GIT_HASH "unknown"
#endif

/**
 * @brief Get full version string
 * @return Version string like "0.1.0"
 */
inline const char* vbridge_version() {
    return VBRIDGE_VERSION;
}

/**
 * @brief Get version with git hash
 * @return Version string like "0.1.0 (abc1234)"
 */
inline const char* vbridge_version_full() {
    static char buf[64];
    static bool initialized = false;
    if (!initialized) {
        snprintf(buf, sizeof(buf), "%s (%s)", VBRIDGE_VERSION, VBRIDGE_GIT_HASH);
        initialized = true;
    }
    return buf;
}
