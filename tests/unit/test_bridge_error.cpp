// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_error.h"

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

TEST_CASE("BridgeError success semantics", "[bridge_error]") {
    SECTION("default constructed is success") {
        BridgeError err;
        REQUIRE(err.success());
        REQUIRE(static_cast<bool>(err));
    }

    SECTION("failure carries both messages") {
        BridgeError err(BridgeResult::CONNECTION_NOT_FOUND, "no profile matches x",
                        "Connection 'x' not found");
        REQUIRE_FALSE(err.success());
        REQUIRE_FALSE(err);
        REQUIRE(err.technical_msg == "no profile matches x");
        REQUIRE(err.user_msg == "Connection 'x' not found");
    }
}

TEST_CASE("result_name gives stable names", "[bridge_error]") {
    REQUIRE(std::string(result_name(BridgeResult::SERVICE_UNAVAILABLE)) == "ServiceUnavailable");
    REQUIRE(std::string(result_name(BridgeResult::INTERFACE_ALREADY_BRIDGED)) ==
            "InterfaceAlreadyBridged");
    REQUIRE(std::string(result_name(BridgeResult::ACTIVATION_FAILED)) == "ActivationFailed");
}

TEST_CASE("Validation-class results never include mutation failures", "[bridge_error]") {
    REQUIRE(is_validation_error(BridgeResult::INVALID_PARAMETER));
    REQUIRE(is_validation_error(BridgeResult::NO_CANDIDATE_INTERFACE));
    REQUIRE(is_validation_error(BridgeResult::BRIDGE_EXISTS));
    REQUIRE_FALSE(is_validation_error(BridgeResult::SERVICE_ERROR));
    REQUIRE_FALSE(is_validation_error(BridgeResult::ACTIVATION_FAILED));
    REQUIRE_FALSE(is_validation_error(BridgeResult::SUCCESS));
}
