// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bridge_planner.h"
#include "network_inspector.h"
#include "run_options.h"

#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief What a mutating operation did, or would do in dry-run mode
 */
struct BuildReport {
    std::vector<std::string> operations; ///< One line per service call, in order
    std::string bridge_uuid;             ///< Set by add()
    std::string port_uuid;               ///< Set by add()
    std::string port_conn_name;          ///< Set by add()
};

/**
 * @brief Sends create/delete/activate/deactivate calls for one bridge
 *
 * Every mutation is a separate, sequential service call. There is no
 * transaction: when a later step fails, earlier ones stay applied and the
 * returned error names what was left behind.
 *
 * In dry-run mode the same lookups and checks run, but only the operation
 * list in the report is filled.
 */
class BridgeBuilder {
  public:
    explicit BridgeBuilder(NetworkInspector& inspector);

    /**
     * @brief Create the bridge profile and its port profile from a plan
     *
     * With plan.force, existing profiles in the way are deleted first: bridges
     * matching the connection or interface name with their ports, other bridge
     * ports bound to the slave, and profiles named like the new port.
     *
     * Both profiles are stored inactive.
     *
     * @return BRIDGE_EXISTS without force, SERVICE_ERROR on a failed call
     */
    BridgeError add(const BridgePlan& plan, BuildReport& report);

    /**
     * @brief Delete a profile; a bridge takes its port profiles with it
     *
     * @return CONNECTION_NOT_FOUND when the name matches nothing
     */
    BridgeError remove(const std::string& name, const RunOptions& run, BuildReport& report);

    /**
     * @brief Bring a stored profile up
     *
     * @return CONNECTION_NOT_FOUND or ACTIVATION_FAILED
     */
    BridgeError activate(const std::string& name, const RunOptions& run, BuildReport& report);

    /**
     * @brief Bring an active profile down; an inactive one is left alone
     *
     * @return CONNECTION_NOT_FOUND or ACTIVATION_FAILED
     */
    BridgeError deactivate(const std::string& name, const RunOptions& run, BuildReport& report);

    /**
     * @brief Bridge profile for a plan, with a fresh UUID
     */
    static ConnectionProfile make_bridge_profile(const BridgePlan& plan, const std::string& uuid);

    /**
     * @brief Ethernet port profile enslaving plan.slave_interface to the bridge
     */
    static ConnectionProfile make_port_profile(const BridgePlan& plan, const std::string& uuid,
                                               const std::string& master_uuid);

  private:
    struct Doomed {
        std::string uuid;
        std::string id;
    };

    BridgeError collect_conflicts(const BridgePlan& plan, std::vector<Doomed>& doomed);
    BridgeError delete_all(const std::vector<Doomed>& doomed, bool dry_run, BuildReport& report);

    NetworkInspector& inspector_;
};

} // namespace vbridge
