// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_settings_codec.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstdio>
#include <optional>

namespace vbridge {

namespace {

template <typename T>
std::optional<T> read_value(const NmSettingsSection& section, const std::string& key) {
    auto it = section.find(key);
    if (it == section.end() || !it->second.template containsValueOfType<T>()) {
        return std::nullopt;
    }
    return it->second.template get<T>();
}

template <typename T>
T read_value(const NmSettingsSection& section, const std::string& key, const T& default_value) {
    auto value = read_value<T>(section, key);
    return value ? *value : default_value;
}

const NmSettingsSection& section_or_empty(const NmSettings& settings, const std::string& name) {
    static const NmSettingsSection empty;
    auto it = settings.find(name);
    return it == settings.end() ? empty : it->second;
}

Ipv4Config parse_ipv4(const NmSettingsSection& ipv4) {
    Ipv4Config config;
    config.method = read_value<std::string>(ipv4, "method", "disabled");

    using AddressData = std::vector<std::map<std::string, sdbus::Variant>>;
    for (const auto& entry : read_value<AddressData>(ipv4, "address-data", {})) {
        auto address = read_value<std::string>(entry, "address");
        if (!address) {
            continue;
        }
        auto prefix = read_value<uint32_t>(entry, "prefix", 32);
        config.addresses.push_back(*address + "/" + std::to_string(prefix));
    }

    config.gateway = read_value<std::string>(ipv4, "gateway", "");

    for (uint32_t dns : read_value<std::vector<uint32_t>>(ipv4, "dns", {})) {
        config.dns.push_back(ipv4_to_string(dns));
    }
    return config;
}

BridgeSettings parse_bridge(const NmSettingsSection& bridge) {
    BridgeSettings settings;
    settings.stp = read_value<bool>(bridge, "stp", true);
    settings.priority = read_value<uint32_t>(bridge, "priority");
    settings.forward_delay = read_value<uint32_t>(bridge, "forward-delay");
    settings.multicast_snooping = read_value<bool>(bridge, "multicast-snooping", true);
    settings.vlan_filtering = read_value<bool>(bridge, "vlan-filtering", false);
    settings.vlan_default_pvid = read_value<uint32_t>(bridge, "vlan-default-pvid");
    settings.mac_address = bytes_to_mac(read_value<std::vector<uint8_t>>(bridge, "mac-address", {}));
    return settings;
}

} // namespace

NmSettings profile_to_settings(const ConnectionProfile& profile) {
    NmSettings settings;

    auto& connection = settings["connection"];
    connection["id"] = sdbus::Variant(profile.id);
    connection["uuid"] = sdbus::Variant(profile.uuid);
    connection["type"] = sdbus::Variant(profile.type);
    if (!profile.interface_name.empty()) {
        connection["interface-name"] = sdbus::Variant(profile.interface_name);
    }
    if (!profile.master.empty()) {
        connection["master"] = sdbus::Variant(profile.master);
    }
    if (!profile.slave_type.empty()) {
        connection["slave-type"] = sdbus::Variant(profile.slave_type);
    }

    if (profile.bridge) {
        const BridgeSettings& b = *profile.bridge;
        auto& bridge = settings["bridge"];
        bridge["stp"] = sdbus::Variant(b.stp);
        bridge["multicast-snooping"] = sdbus::Variant(b.multicast_snooping);
        bridge["vlan-filtering"] = sdbus::Variant(b.vlan_filtering);
        if (b.priority) {
            bridge["priority"] = sdbus::Variant(*b.priority);
        }
        if (b.forward_delay) {
            bridge["forward-delay"] = sdbus::Variant(*b.forward_delay);
        }
        if (b.vlan_default_pvid) {
            bridge["vlan-default-pvid"] = sdbus::Variant(*b.vlan_default_pvid);
        }
        auto mac = mac_to_bytes(b.mac_address);
        if (!mac.empty()) {
            bridge["mac-address"] = sdbus::Variant(mac);
        }
    }

    if (!profile.ipv4.method.empty()) {
        settings["ipv4"]["method"] = sdbus::Variant(profile.ipv4.method);
    }

    return settings;
}

ConnectionProfile settings_to_profile(const NmSettings& settings) {
    ConnectionProfile profile;

    const auto& connection = section_or_empty(settings, "connection");
    profile.id = read_value<std::string>(connection, "id", "");
    profile.uuid = read_value<std::string>(connection, "uuid", "");
    profile.type = read_value<std::string>(connection, "type", "");
    profile.interface_name = read_value<std::string>(connection, "interface-name", "");
    profile.master = read_value<std::string>(connection, "master", "");
    profile.slave_type = read_value<std::string>(connection, "slave-type", "");

    profile.ipv4 = parse_ipv4(section_or_empty(settings, "ipv4"));

    if (profile.is_bridge()) {
        profile.bridge = parse_bridge(section_or_empty(settings, "bridge"));
    }
    return profile;
}

std::vector<uint8_t> mac_to_bytes(const std::string& mac) {
    std::vector<uint8_t> bytes;
    unsigned int b[6];
    char trailing;
    if (sscanf(mac.c_str(), "%2x:%2x:%2x:%2x:%2x:%2x%c", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5],
               &trailing) != 6) {
        return bytes;
    }
    for (unsigned int v : b) {
        bytes.push_back(static_cast<uint8_t>(v));
    }
    return bytes;
}

std::string bytes_to_mac(const std::vector<uint8_t>& bytes) {
    std::string mac;
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        snprintf(buf, sizeof(buf), i == 0 ? "%02X" : ":%02X", bytes[i]);
        mac += buf;
    }
    return mac;
}

std::string ipv4_to_string(uint32_t network_order) {
    struct in_addr addr;
    addr.s_addr = network_order;
    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
        return "";
    }
    return std::string(buf);
}

} // namespace vbridge
