// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nm_backend.h"

#include <sdbus-c++/sdbus-c++.h>

#include <memory>
#include <string>

namespace vbridge {

/**
 * @brief Whether a D-Bus error name means NetworkManager stopped answering
 *
 * Such errors abort the connection listing with SERVICE_UNAVAILABLE. Any
 * other failure while reading one profile skips that profile only.
 */
bool is_unreachable_error(const std::string& error_name);

/**
 * @brief NetworkManager backend over the D-Bus system bus
 *
 * Talks to org.freedesktop.NetworkManager through sdbus-c++ proxies:
 * - /org/freedesktop/NetworkManager          (devices, activation)
 * - /org/freedesktop/NetworkManager/Settings (profile storage)
 *
 * Every sdbus::Error is caught at this boundary and mapped to a BridgeResult;
 * callers never see D-Bus exceptions.
 */
class NmBackendDbus : public NmBackend {
  public:
    NmBackendDbus();
    ~NmBackendDbus() override;

    // ========================================================================
    // NmBackend Interface Implementation
    // ========================================================================

    BridgeError start() override;
    bool is_running() const override;

    BridgeError get_devices(std::vector<Device>& devices) override;
    BridgeError get_connections(std::vector<ConnectionProfile>& connections) override;
    std::optional<Ipv4Config> get_live_ipv4(const std::string& interface) override;

    BridgeError add_connection(const ConnectionProfile& profile) override;
    BridgeError delete_connection(const std::string& uuid) override;
    BridgeError activate_connection(const std::string& uuid) override;
    BridgeError deactivate_connection(const std::string& uuid) override;

  private:
    /**
     * @brief Read one device object into a Device
     */
    Device read_device(const sdbus::ObjectPath& path);

    /**
     * @brief Id of the profile behind an active connection object, empty on failure
     */
    std::string active_connection_id(const sdbus::ObjectPath& path);

    /**
     * @brief Settings object path for a profile UUID
     */
    sdbus::ObjectPath connection_path(const std::string& uuid);

    /**
     * @brief Translate an sdbus error into a BridgeError
     *
     * @param fallback Result used for errors that are not connectivity problems
     * @param what Operator-facing description of the failed step
     */
    BridgeError map_error(const sdbus::Error& e, BridgeResult fallback, const std::string& what);

    BridgeError not_started() const;

    std::unique_ptr<sdbus::IConnection> connection_;
    std::unique_ptr<sdbus::IProxy> nm_proxy_;
    std::unique_ptr<sdbus::IProxy> settings_proxy_;
};

} // namespace vbridge
