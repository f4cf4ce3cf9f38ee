// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "vbridge_version.h"

#include <string>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Version string comes from the build", "[version]") {
    std::string version = vbridge_version();
    REQUIRE_FALSE(version.empty());
    REQUIRE(version == VBRIDGE_VERSION);
}

TEST_CASE("Full version appends the git hash", "[version]") {
    std::string full = vbridge_version_full();
    REQUIRE(full == std::string(VBRIDGE_VERSION) + " (" + VBRIDGE_GIT_HASH + ")");

    // Cached buffer is stable across calls
    REQUIRE(vbridge_version_full() == vbridge_version_full());
}
