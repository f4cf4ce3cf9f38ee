// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_types.h"

#include <algorithm>
#include <map>

namespace vbridge {

namespace {

const std::map<uint32_t, const char*>& device_type_table() {
    static const std::map<uint32_t, const char*> table = {
        {0, "Unknown"},        {1, "Ethernet"},       {2, "Wi-Fi"},       {3, "WWAN"},
        {4, "OLPC Mesh"},      {5, "Bridge"},         {6, "Bluetooth"},   {7, "WiMAX"},
        {8, "Modem"},          {9, "TUN"},            {10, "InfiniBand"}, {11, "Bond"},
        {12, "VLAN"},          {13, "ADSL"},          {14, "Team"},       {15, "Generic"},
        {16, "Veth"},          {17, "MACVLAN"},       {18, "OVS Port"},   {19, "OVS Interface"},
        {20, "Dummy"},         {21, "MACsec"},        {22, "IPVLAN"},     {23, "OVS Bridge"},
        {24, "IP Tunnel"},     {25, "Loopback"},      {26, "6LoWPAN"},    {27, "HSR"},
        {28, "Wi-Fi P2P"},     {29, "VRF"},           {30, "WireGuard"},  {31, "WPAN"},
        {32, "VPRP"},
    };
    return table;
}

const std::map<uint32_t, const char*>& device_state_table() {
    static const std::map<uint32_t, const char*> table = {
        {10, "Unmanaged"},  {20, "Unavailable"}, {30, "Disconnected"}, {40, "Prepare"},
        {50, "Config"},     {60, "Need Auth"},   {70, "IP Config"},    {80, "IP Check"},
        {90, "Secondaries"}, {100, "Activated"}, {110, "Deactivating"}, {120, "Failed"},
    };
    return table;
}

std::string lookup(const std::map<uint32_t, const char*>& table, uint32_t code) {
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown (" + std::to_string(code) + ")";
}

} // namespace

std::string device_type_name(uint32_t type) {
    return lookup(device_type_table(), type);
}

std::string device_state_name(uint32_t state) {
    return lookup(device_state_table(), state);
}

bool BridgeProfile::has_port(const std::string& interface) const {
    return std::any_of(ports.begin(), ports.end(),
                       [&](const BridgePort& p) { return p.interface == interface; });
}

} // namespace vbridge
