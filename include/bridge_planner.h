// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_error.h"
#include "network_inspector.h"
#include "run_options.h"

#include <optional>
#include <string>
#include <vector>

namespace vbridge {

/// STP priority range accepted by the kernel bridge
constexpr long STP_PRIORITY_MIN = 0;
constexpr long STP_PRIORITY_MAX = 65535;

/// Forward delay range in seconds
constexpr long FORWARD_DELAY_MIN = 0;
constexpr long FORWARD_DELAY_MAX = 30;

/// Valid 802.1Q VLAN ids for the default PVID
constexpr long VLAN_PVID_MIN = 1;
constexpr long VLAN_PVID_MAX = 4094;

/**
 * @brief Options of the add command, after defaults are applied
 *
 * Numeric values are kept wide and unvalidated here; range checks happen in
 * BridgePlanner::plan() so that every entry point reports them the same way.
 */
struct BridgeOptions {
    std::string conn_name = "c-mybr0";
    std::string bridge_ifname = "mybr0";
    std::string slave_interface; ///< Empty selects a slave automatically
    bool clone_mac = true;
    bool stp = true;
    std::optional<long> stp_priority;
    std::optional<long> forward_delay;
    bool multicast_snooping = true;
    bool vlan_filtering = false;
    std::optional<long> vlan_default_pvid;
};

/**
 * @brief Concrete configuration to apply for one add
 */
struct BridgePlan {
    std::string conn_name;
    std::string bridge_ifname;
    std::string slave_interface;
    std::string port_conn_name;   ///< "<conn_name>-port-<slave_interface>"
    bool slave_auto_selected = false;
    BridgeSettings bridge;        ///< mac_address holds the cloned MAC, if any
    bool force = false;
    bool dry_run = false;
};

/**
 * @brief Port profile name for a bridge connection and its slave
 */
std::string port_connection_name(const std::string& conn_name, const std::string& slave);

/**
 * @brief Turns add options into a validated BridgePlan
 *
 * Reads live device and bridge state through the inspector but never mutates
 * anything, so dry-run and real runs share the same validation.
 */
class BridgePlanner {
  public:
    explicit BridgePlanner(NetworkInspector& inspector);

    /**
     * @brief Validate options and resolve the slave interface
     *
     * @param options Add options with defaults applied
     * @param run Force/dry-run flags for this invocation
     * @param[out] plan Filled on success
     * @return INVALID_PARAMETER, INTERFACE_NOT_FOUND, NO_CANDIDATE_INTERFACE,
     *         INTERFACE_ALREADY_BRIDGED or SERVICE_UNAVAILABLE on failure
     */
    BridgeError plan(const BridgeOptions& options, const RunOptions& run, BridgePlan& plan);

    /**
     * @brief Pick a slave from the live device list
     *
     * First activated Ethernet device in interface-name order, then the first
     * activated Wi-Fi device. Ignored prefixes are skipped.
     *
     * @param devices Live device snapshot
     * @param[out] interface Selected interface name
     * @return NO_CANDIDATE_INTERFACE when nothing qualifies
     */
    BridgeError select_slave(const std::vector<Device>& devices, std::string& interface) const;

  private:
    BridgeError validate(const BridgeOptions& options) const;

    NetworkInspector& inspector_;
};

} // namespace vbridge
