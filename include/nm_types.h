// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vbridge {

/**
 * @brief NetworkManager device type codes (NMDeviceType)
 *
 * Only the codes the tool branches on are named; every other code is carried
 * as-is and rendered through device_type_name().
 */
namespace device_type {
constexpr uint32_t UNKNOWN = 0;
constexpr uint32_t ETHERNET = 1;
constexpr uint32_t WIFI = 2;
constexpr uint32_t BRIDGE = 5;
constexpr uint32_t ADSL = 13;
constexpr uint32_t LOOPBACK = 25;
constexpr uint32_t WIFI_P2P = 28;
constexpr uint32_t WIREGUARD = 30;
} // namespace device_type

/**
 * @brief NetworkManager device state codes (NMDeviceState)
 */
namespace device_state {
constexpr uint32_t UNMANAGED = 10;
constexpr uint32_t UNAVAILABLE = 20;
constexpr uint32_t DISCONNECTED = 30;
constexpr uint32_t ACTIVATED = 100;
} // namespace device_state

/// "Ethernet", "Wi-Fi", ... or "Unknown (<n>)"
std::string device_type_name(uint32_t type);

/// "Activated", "Disconnected", ... or "Unknown (<n>)"
std::string device_state_name(uint32_t state);

/**
 * @brief Snapshot of one network device as reported by NetworkManager
 */
struct Device {
    std::string interface;   ///< Interface name (e.g., "eth0")
    uint32_t type = device_type::UNKNOWN;
    std::string mac_address; ///< Empty when the device has no hardware address
    uint32_t state = device_state::UNAVAILABLE;
    std::string connection;  ///< Id of the active profile bound to it, empty if none
    bool autoconnect = false;
    bool has_ipv4 = false;   ///< Device currently holds at least one IPv4 address

    Device() = default;
    Device(const std::string& iface, uint32_t t, uint32_t s, const std::string& mac = "")
        : interface(iface), type(t), mac_address(mac), state(s) {}
};

/**
 * @brief IPv4 configuration of a profile or of a live device
 */
struct Ipv4Config {
    std::string method;                 ///< "auto", "manual", "disabled", ...
    std::vector<std::string> addresses; ///< CIDR strings ("192.168.1.10/24")
    std::string gateway;
    std::vector<std::string> dns;
};

/**
 * @brief Bridge section of a bridge profile
 *
 * Unset optionals mean NetworkManager keeps its own default for that key.
 */
struct BridgeSettings {
    bool stp = true;
    std::optional<uint32_t> priority;
    std::optional<uint32_t> forward_delay;
    bool multicast_snooping = true;
    bool vlan_filtering = false;
    std::optional<uint32_t> vlan_default_pvid;
    std::string mac_address; ///< Cloned MAC, empty if not set

    bool operator==(const BridgeSettings& o) const {
        return stp == o.stp && priority == o.priority && forward_delay == o.forward_delay &&
               multicast_snooping == o.multicast_snooping && vlan_filtering == o.vlan_filtering &&
               vlan_default_pvid == o.vlan_default_pvid && mac_address == o.mac_address;
    }
    bool operator!=(const BridgeSettings& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Stored NetworkManager connection profile
 */
struct ConnectionProfile {
    std::string id;             ///< Human-readable name
    std::string uuid;
    std::string type;           ///< "bridge", "802-3-ethernet", ...
    std::string interface_name; ///< Empty when not bound to an interface
    std::string master;         ///< Master UUID (ports only)
    std::string slave_type;     ///< "bridge" for bridge ports
    bool active = false;
    Ipv4Config ipv4;
    std::optional<BridgeSettings> bridge; ///< Present for type "bridge"

    bool is_bridge() const {
        return type == "bridge";
    }
    bool is_bridge_port() const {
        return slave_type == "bridge";
    }
};

/**
 * @brief A port profile resolved against its bridge
 */
struct BridgePort {
    std::string interface; ///< Enslaved interface name
    std::string conn_id;   ///< Port profile id
    std::string uuid;
};

/**
 * @brief Bridge profile enriched with its resolved ports
 */
struct BridgeProfile {
    ConnectionProfile profile;
    std::vector<BridgePort> ports;

    bool has_port(const std::string& interface) const;
};

} // namespace vbridge
