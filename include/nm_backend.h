// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "nm_types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief Abstract NetworkManager backend interface
 *
 * Exposes the handful of service capabilities the tool is built on:
 * device enumeration, profile enumeration, profile create/delete and
 * activate/deactivate. Concrete implementations:
 * - NmBackendDbus: NetworkManager over the D-Bus system bus (sdbus-c++)
 * - NmBackendMock: in-memory fake for tests and --mock demo mode
 *
 * Design principles:
 * - Synchronous, blocking calls; no retries
 * - Every call reports a BridgeError; nothing throws across this interface
 * - Returned data is a snapshot, callers never cache it across commands
 */
class NmBackend {
  public:
    virtual ~NmBackend() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Connect to the service
     *
     * @return SERVICE_UNAVAILABLE if NetworkManager cannot be reached
     */
    virtual BridgeError start() = 0;

    /**
     * @brief Check if start() succeeded
     */
    virtual bool is_running() const = 0;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Enumerate all devices known to the service
     *
     * @param[out] devices Populated in service enumeration order
     */
    virtual BridgeError get_devices(std::vector<Device>& devices) = 0;

    /**
     * @brief Enumerate all stored connection profiles
     *
     * Each profile's active flag reflects the service's active connections
     * at the time of the call.
     *
     * @param[out] connections Populated in service enumeration order
     */
    virtual BridgeError get_connections(std::vector<ConnectionProfile>& connections) = 0;

    /**
     * @brief Live IPv4 state of a device
     *
     * Resolution failures are not errors: an unresolvable interface simply
     * yields no value.
     */
    virtual std::optional<Ipv4Config> get_live_ipv4(const std::string& interface) = 0;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Store a new persistent profile (not activated)
     *
     * The profile's uuid must already be set.
     */
    virtual BridgeError add_connection(const ConnectionProfile& profile) = 0;

    /**
     * @brief Delete a stored profile by UUID
     */
    virtual BridgeError delete_connection(const std::string& uuid) = 0;

    /**
     * @brief Activate a stored profile by UUID
     */
    virtual BridgeError activate_connection(const std::string& uuid) = 0;

    /**
     * @brief Deactivate the active connection created from a profile
     */
    virtual BridgeError deactivate_connection(const std::string& uuid) = 0;

    // ========================================================================
    // Factory Method
    // ========================================================================

    /**
     * @brief Create the backend for this run
     *
     * @param force_mock If true, return the in-memory mock seeded with demo devices
     * @return Unique pointer to an unstarted backend
     */
    static std::unique_ptr<NmBackend> create(bool force_mock = false);
};

} // namespace vbridge
