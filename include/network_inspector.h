// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nm_backend.h"

#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief Read-only view over devices and profiles
 *
 * Every call queries the backend afresh; nothing is cached between calls.
 * Formatting helpers render the results as fixed-column tables.
 */
class NetworkInspector {
  public:
    /**
     * @param backend Started backend; must outlive the inspector
     * @param ignored_prefixes Interface prefixes excluded from slave candidates
     */
    explicit NetworkInspector(NmBackend& backend,
                              std::vector<std::string> ignored_prefixes = {});

    BridgeError list_devices(std::vector<Device>& devices);
    BridgeError list_connections(std::vector<ConnectionProfile>& connections);

    /**
     * @brief Bridge profiles with their port profiles resolved
     *
     * Ports are matched by master UUID (or master interface name, which
     * NetworkManager also accepts). The bridge's stored IPv4 config is
     * replaced by the live one when its device currently has an IPv4 config.
     */
    BridgeError list_bridges(std::vector<BridgeProfile>& bridges);

    /**
     * @brief Find a profile by id or UUID
     *
     * @return CONNECTION_NOT_FOUND when no profile matches
     */
    BridgeError find_connection(const std::string& name_or_uuid, ConnectionProfile& out);

    /**
     * @brief Sorted Ethernet/Wi-Fi interface names usable as bridge slaves
     *
     * Empty when the service cannot be queried.
     */
    std::vector<std::string> slave_candidates();

    /**
     * @brief Every profile id and UUID, for completion
     */
    std::vector<std::string> connection_identifiers();

    /**
     * @brief Whether an interface name starts with an ignored prefix
     */
    bool is_ignored(const std::string& interface) const;

    NmBackend& backend() {
        return backend_;
    }

  private:
    NmBackend& backend_;
    std::vector<std::string> ignored_prefixes_;
};

// ============================================================================
// Report formatting
// ============================================================================

/// Device table (INTERFACE / DEV TYPE / MAC ADDRESS / STATE / CONNECTION / AUTOCONNECT)
std::string format_device_table(const std::vector<Device>& devices);

/// Connection table sorted by name (NAME (ID) / TYPE / INTERFACE / UUID)
std::string format_connection_table(const std::vector<ConnectionProfile>& connections);

/// Tree report of bridges, their ports, bridge settings and IPv4 config
std::string format_bridge_report(const std::vector<BridgeProfile>& bridges);

} // namespace vbridge
