// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_backend_dbus.h"

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

TEST_CASE("Unreachable service errors abort listings", "[nm_backend_dbus]") {
    REQUIRE(is_unreachable_error("org.freedesktop.DBus.Error.ServiceUnknown"));
    REQUIRE(is_unreachable_error("org.freedesktop.DBus.Error.NameHasNoOwner"));
    REQUIRE(is_unreachable_error("org.freedesktop.DBus.Error.NoReply"));
    REQUIRE(is_unreachable_error("org.freedesktop.DBus.Error.Timeout"));
    REQUIRE(is_unreachable_error("org.freedesktop.DBus.Error.Spawn.ChildExited"));
}

TEST_CASE("Per-object errors only skip the object", "[nm_backend_dbus]") {
    // What GetSettings raises for a profile deleted after ListConnections
    REQUIRE_FALSE(is_unreachable_error("org.freedesktop.DBus.Error.UnknownObject"));
    REQUIRE_FALSE(is_unreachable_error("org.freedesktop.DBus.Error.UnknownMethod"));
    REQUIRE_FALSE(is_unreachable_error("org.freedesktop.NetworkManager.Settings.Connection"
                                       ".InvalidConnection"));
    REQUIRE_FALSE(is_unreachable_error("org.freedesktop.NetworkManager.PermissionDenied"));
    REQUIRE_FALSE(is_unreachable_error(""));
}
