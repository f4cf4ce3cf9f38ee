// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "network_inspector.h"
#include "nm_backend_mock.h"
#include "uuid_utils.h"

#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief Started mock backend plus an inspector using the default ignore list
 *
 * Starts with no devices and no profiles; tests seed exactly what they need.
 */
class BridgeTestFixture {
  protected:
    NmBackendMock backend;
    NetworkInspector inspector{backend, {"lo", "virbr", "vnet", "docker", "p2p-dev-"}};

    BridgeTestFixture() {
        backend.start();
    }

    void add_device(const std::string& iface, uint32_t type, uint32_t state,
                    const std::string& mac = "") {
        backend.add_device(Device(iface, type, state, mac));
    }

    /// Store a plain profile and return its UUID
    std::string add_profile(const std::string& id, const std::string& type,
                            const std::string& iface) {
        ConnectionProfile p;
        p.id = id;
        p.uuid = generate_uuid_v4();
        p.type = type;
        p.interface_name = iface;
        backend.add_connection(p);
        return p.uuid;
    }

    /// Store a bridge profile and return its UUID
    std::string add_bridge(const std::string& id, const std::string& iface) {
        ConnectionProfile p;
        p.id = id;
        p.uuid = generate_uuid_v4();
        p.type = "bridge";
        p.interface_name = iface;
        p.ipv4.method = "auto";
        p.bridge = BridgeSettings{};
        backend.add_connection(p);
        return p.uuid;
    }

    /// Store a bridge port profile enslaving iface to master_uuid
    std::string add_port(const std::string& id, const std::string& iface,
                         const std::string& master_uuid) {
        ConnectionProfile p;
        p.id = id;
        p.uuid = generate_uuid_v4();
        p.type = "802-3-ethernet";
        p.interface_name = iface;
        p.master = master_uuid;
        p.slave_type = "bridge";
        backend.add_connection(p);
        return p.uuid;
    }

    std::vector<BridgeProfile> bridges() {
        std::vector<BridgeProfile> out;
        inspector.list_bridges(out);
        return out;
    }

    std::vector<ConnectionProfile> connections() {
        std::vector<ConnectionProfile> out;
        inspector.list_connections(out);
        return out;
    }
};

} // namespace vbridge
