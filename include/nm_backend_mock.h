// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nm_backend.h"

#include <map>
#include <set>

namespace vbridge {

/**
 * @brief In-memory NetworkManager backend for testing and demo mode
 *
 * Keeps devices and profiles in plain containers and applies mutations to
 * them directly. Useful for:
 * - Unit testing planner/builder/dispatcher without a system bus
 * - Running the CLI with --mock on machines without NetworkManager
 *
 * Test API allows seeding devices and injecting service failures.
 */
class NmBackendMock : public NmBackend {
  public:
    NmBackendMock();
    ~NmBackendMock() override;

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

    // ========================================================================
    // Test API
    // ========================================================================

    /**
     * @brief Add a device (replaces any device with the same interface name)
     */
    void add_device(const Device& device);

    /**
     * @brief Simulate NetworkManager dropping off the bus
     *
     * While unavailable, every call fails with SERVICE_UNAVAILABLE.
     */
    void set_service_available(bool available);

    /**
     * @brief Make add_connection() reject the profile with this id
     */
    void fail_add_for(const std::string& conn_id, const std::string& message);

    /**
     * @brief Make delete_connection() fail for the profile with this id
     */
    void fail_delete_for(const std::string& conn_id, const std::string& message);

    /**
     * @brief Make activate_connection() fail for the profile with this id
     */
    void fail_activation_for(const std::string& conn_id, const std::string& message);

    /**
     * @brief Set the live IPv4 state reported for an interface
     */
    void set_live_ipv4(const std::string& interface, const Ipv4Config& config);

    /**
     * @brief Number of successful mutating calls since construction
     */
    int mutation_count() const {
        return mutation_count_;
    }

    /**
     * @brief Stored profiles, in insertion order
     */
    const std::vector<ConnectionProfile>& connections() const {
        return connections_;
    }

    /**
     * @brief Clear all devices, profiles and injected failures
     */
    void clear_all();

    /**
     * @brief Seed a typical virtualization host
     *
     * lo, an activated Ethernet NIC with its "Wired connection 1" profile,
     * a disconnected second NIC, a Wi-Fi card and libvirt's virbr0.
     */
    void add_demo_devices();

  private:
    BridgeError check_available(const char* op) const;
    ConnectionProfile* find_by_uuid(const std::string& uuid);
    Device* find_device(const std::string& interface);

    bool running_;
    bool available_;
    int mutation_count_;
    std::vector<Device> devices_;
    std::vector<ConnectionProfile> connections_;
    std::map<std::string, Ipv4Config> live_ipv4_;         ///< interface -> live config
    std::map<std::string, std::string> add_failures_;     ///< conn id -> message
    std::map<std::string, std::string> delete_failures_;  ///< conn id -> message
    std::map<std::string, std::string> activate_failures_; ///< conn id -> message
};

} // namespace vbridge
