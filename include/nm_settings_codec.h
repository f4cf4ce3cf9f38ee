// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nm_types.h"

#include <sdbus-c++/sdbus-c++.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vbridge {

/// One setting section ("connection", "bridge", "ipv4", ...) - a{sv}
using NmSettingsSection = std::map<std::string, sdbus::Variant>;

/// Full connection settings as exchanged with NetworkManager - a{sa{sv}}
using NmSettings = std::map<std::string, NmSettingsSection>;

/**
 * @brief Build the AddConnection dictionary for a profile
 *
 * Bridge keys are sent with the D-Bus types NetworkManager declares for them
 * (u for priority/forward-delay/vlan-default-pvid, b for flags, ay for the
 * cloned MAC). Unset optionals are omitted so NetworkManager keeps its defaults.
 */
NmSettings profile_to_settings(const ConnectionProfile& profile);

/**
 * @brief Parse a GetSettings reply
 *
 * Missing or mistyped keys fall back to NetworkManager's documented defaults;
 * parsing never fails.
 */
ConnectionProfile settings_to_profile(const NmSettings& settings);

/**
 * @brief "52:54:00:12:34:56" -> 6 bytes; empty vector when malformed
 */
std::vector<uint8_t> mac_to_bytes(const std::string& mac);

/**
 * @brief Bytes -> upper-case colon-separated MAC; empty string for no bytes
 */
std::string bytes_to_mac(const std::vector<uint8_t>& bytes);

/**
 * @brief IPv4 address as NetworkManager sends it in "au" arrays (network order)
 */
std::string ipv4_to_string(uint32_t network_order);

} // namespace vbridge
