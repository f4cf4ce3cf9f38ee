// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_error.h"

namespace vbridge {

const char* result_name(BridgeResult result) {
    switch (result) {
    case BridgeResult::SUCCESS:
        return "Success";
    case BridgeResult::SERVICE_UNAVAILABLE:
        return "ServiceUnavailable";
    case BridgeResult::INVALID_PARAMETER:
        return "InvalidParameter";
    case BridgeResult::INTERFACE_NOT_FOUND:
        return "InterfaceNotFound";
    case BridgeResult::NO_CANDIDATE_INTERFACE:
        return "NoCandidateInterface";
    case BridgeResult::BRIDGE_EXISTS:
        return "BridgeExists";
    case BridgeResult::INTERFACE_ALREADY_BRIDGED:
        return "InterfaceAlreadyBridged";
    case BridgeResult::CONNECTION_NOT_FOUND:
        return "ConnectionNotFound";
    case BridgeResult::ACTIVATION_FAILED:
        return "ActivationFailed";
    case BridgeResult::SERVICE_ERROR:
        return "ServiceError";
    case BridgeResult::USAGE_ERROR:
        return "UsageError";
    }
    return "Unknown";
}

bool is_validation_error(BridgeResult result) {
    switch (result) {
    case BridgeResult::INVALID_PARAMETER:
    case BridgeResult::INTERFACE_NOT_FOUND:
    case BridgeResult::NO_CANDIDATE_INTERFACE:
    case BridgeResult::BRIDGE_EXISTS:
    case BridgeResult::INTERFACE_ALREADY_BRIDGED:
    case BridgeResult::CONNECTION_NOT_FOUND:
    case BridgeResult::USAGE_ERROR:
        return true;
    default:
        return false;
    }
}

} // namespace vbridge
