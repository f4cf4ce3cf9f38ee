// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vbridge {

/**
 * @brief Result codes for bridge and NetworkManager operations
 */
enum class BridgeResult {
    SUCCESS = 0,               ///< Operation succeeded
    SERVICE_UNAVAILABLE,       ///< NetworkManager not reachable on the system bus
    INVALID_PARAMETER,         ///< Out-of-range or malformed option
    INTERFACE_NOT_FOUND,       ///< Named interface absent from the live device list
    NO_CANDIDATE_INTERFACE,    ///< Automatic slave selection found nothing usable
    BRIDGE_EXISTS,             ///< A bridge with the requested name already exists
    INTERFACE_ALREADY_BRIDGED, ///< Slave interface is already a port of another bridge
    CONNECTION_NOT_FOUND,      ///< No profile with the given name or UUID
    ACTIVATION_FAILED,         ///< Service refused to bring a connection up or down
    SERVICE_ERROR,             ///< Any other failed service call (add/delete rejected)
    USAGE_ERROR                ///< Unknown command, unknown flag, missing argument
};

/**
 * @brief Detailed error information for bridge operations
 */
struct BridgeError {
    BridgeResult result;       ///< Primary error code
    std::string technical_msg; ///< Technical details for debug logging
    std::string user_msg;      ///< Operator-facing message

    BridgeError(BridgeResult r = BridgeResult::SUCCESS, const std::string& tech = "",
                const std::string& user = "")
        : result(r), technical_msg(tech), user_msg(user) {}

    bool success() const {
        return result == BridgeResult::SUCCESS;
    }
    operator bool() const {
        return success();
    }
};

/**
 * @brief Short stable name of a result code ("ConnectionNotFound", ...)
 */
const char* result_name(BridgeResult result);

/**
 * @brief Whether the result is a validation-class failure
 *
 * Validation failures are raised before any mutation is attempted and are the
 * only failures a dry-run may produce.
 */
bool is_validation_error(BridgeResult result);

} // namespace vbridge
