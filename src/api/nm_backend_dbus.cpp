// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_backend_dbus.h"

#include "nm_settings_codec.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <set>

namespace vbridge {

namespace {

constexpr const char* NM_BUS_NAME = "org.freedesktop.NetworkManager";
constexpr const char* NM_OBJECT_PATH = "/org/freedesktop/NetworkManager";
constexpr const char* NM_SETTINGS_PATH = "/org/freedesktop/NetworkManager/Settings";

constexpr const char* NM_IFACE = "org.freedesktop.NetworkManager";
constexpr const char* NM_SETTINGS_IFACE = "org.freedesktop.NetworkManager.Settings";
constexpr const char* NM_CONNECTION_IFACE = "org.freedesktop.NetworkManager.Settings.Connection";
constexpr const char* NM_DEVICE_IFACE = "org.freedesktop.NetworkManager.Device";
constexpr const char* NM_ACTIVE_IFACE = "org.freedesktop.NetworkManager.Connection.Active";
constexpr const char* NM_IP4_IFACE = "org.freedesktop.NetworkManager.IP4Config";

constexpr const char* NO_OBJECT = "/";

using VariantDict = std::map<std::string, sdbus::Variant>;

// NetworkManager reports a few device types wrongly on some versions
uint32_t corrected_device_type(uint32_t type, const std::string& iface) {
    if (type == device_type::ADSL && iface.find("br") != std::string::npos) {
        spdlog::debug("[NmBackendDbus] Correcting device type for {} from 13 to 5", iface);
        return device_type::BRIDGE;
    }
    if (type == device_type::WIREGUARD && iface.rfind("p2p-dev-", 0) == 0) {
        spdlog::debug("[NmBackendDbus] Correcting device type for {} from 30 to 28", iface);
        return device_type::WIFI_P2P;
    }
    return type;
}

} // namespace

bool is_unreachable_error(const std::string& name) {
    static const std::set<std::string> names = {
        "org.freedesktop.DBus.Error.ServiceUnknown", "org.freedesktop.DBus.Error.NameHasNoOwner",
        "org.freedesktop.DBus.Error.NoReply",        "org.freedesktop.DBus.Error.Disconnected",
        "org.freedesktop.DBus.Error.NoServer",       "org.freedesktop.DBus.Error.FileNotFound",
        "org.freedesktop.DBus.Error.Timeout",        "org.freedesktop.DBus.Error.TimedOut",
    };
    return names.count(name) > 0 || name.rfind("org.freedesktop.DBus.Error.Spawn", 0) == 0;
}

NmBackendDbus::NmBackendDbus() {
    spdlog::debug("[NmBackendDbus] Created");
}

NmBackendDbus::~NmBackendDbus() {
    // Proxies must go before the connection they reference
    settings_proxy_.reset();
    nm_proxy_.reset();
    connection_.reset();
    fprintf(stderr, "[NmBackendDbus] Disconnected from system bus\n");
}

BridgeError NmBackendDbus::start() {
    if (connection_) {
        return BridgeError(BridgeResult::SUCCESS);
    }

    try {
        connection_ = sdbus::createSystemBusConnection();
        nm_proxy_ = sdbus::createProxy(*connection_, NM_BUS_NAME, NM_OBJECT_PATH);
        settings_proxy_ = sdbus::createProxy(*connection_, NM_BUS_NAME, NM_SETTINGS_PATH);

        std::string version = nm_proxy_->getProperty("Version").onInterface(NM_IFACE).get<std::string>();
        spdlog::debug("[NmBackendDbus] Connected to NetworkManager {}", version);
    } catch (const sdbus::Error& e) {
        settings_proxy_.reset();
        nm_proxy_.reset();
        connection_.reset();
        spdlog::debug("[NmBackendDbus] start failed: {}: {}", e.getName(), e.getMessage());
        return BridgeError(BridgeResult::SERVICE_UNAVAILABLE, e.getName() + ": " + e.getMessage(),
                           "Cannot reach NetworkManager on the system bus. "
                           "Please ensure NetworkManager is running.");
    }

    return BridgeError(BridgeResult::SUCCESS);
}

bool NmBackendDbus::is_running() const {
    return connection_ != nullptr;
}

BridgeError NmBackendDbus::not_started() const {
    return BridgeError(BridgeResult::SERVICE_UNAVAILABLE, "backend not started",
                       "Not connected to NetworkManager");
}

BridgeError NmBackendDbus::map_error(const sdbus::Error& e, BridgeResult fallback,
                                     const std::string& what) {
    std::string technical = e.getName() + ": " + e.getMessage();
    spdlog::debug("[NmBackendDbus] {} failed: {}", what, technical);

    if (is_unreachable_error(e.getName())) {
        return BridgeError(BridgeResult::SERVICE_UNAVAILABLE, technical,
                           what + ": NetworkManager is not reachable");
    }
    return BridgeError(fallback, technical, what + ": " + e.getMessage());
}

// ============================================================================
// Queries
// ============================================================================

Device NmBackendDbus::read_device(const sdbus::ObjectPath& path) {
    auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, path);

    Device dev;
    dev.interface = proxy->getProperty("Interface").onInterface(NM_DEVICE_IFACE).get<std::string>();
    uint32_t type = proxy->getProperty("DeviceType").onInterface(NM_DEVICE_IFACE).get<uint32_t>();
    dev.type = corrected_device_type(type, dev.interface);
    dev.state = proxy->getProperty("State").onInterface(NM_DEVICE_IFACE).get<uint32_t>();
    dev.autoconnect = proxy->getProperty("Autoconnect").onInterface(NM_DEVICE_IFACE).get<bool>();

    try {
        dev.mac_address =
            proxy->getProperty("HwAddress").onInterface(NM_DEVICE_IFACE).get<std::string>();
    } catch (const sdbus::Error& e) {
        spdlog::trace("[NmBackendDbus] No HwAddress for {}: {}", dev.interface, e.getMessage());
    }

    auto active = proxy->getProperty("ActiveConnection")
                      .onInterface(NM_DEVICE_IFACE)
                      .get<sdbus::ObjectPath>();
    if (active != NO_OBJECT) {
        dev.connection = active_connection_id(active);
    }

    auto ip4 = proxy->getProperty("Ip4Config").onInterface(NM_DEVICE_IFACE).get<sdbus::ObjectPath>();
    if (ip4 != NO_OBJECT) {
        try {
            auto ip4_proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, ip4);
            auto data = ip4_proxy->getProperty("AddressData")
                            .onInterface(NM_IP4_IFACE)
                            .get<std::vector<VariantDict>>();
            dev.has_ipv4 = !data.empty();
        } catch (const sdbus::Error& e) {
            spdlog::trace("[NmBackendDbus] No IPv4 data for {}: {}", dev.interface, e.getMessage());
        }
    }

    return dev;
}

std::string NmBackendDbus::active_connection_id(const sdbus::ObjectPath& path) {
    try {
        auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, path);
        return proxy->getProperty("Id").onInterface(NM_ACTIVE_IFACE).get<std::string>();
    } catch (const sdbus::Error& e) {
        // Active connections can vanish between enumeration and lookup
        spdlog::debug("[NmBackendDbus] Active connection {} unreadable: {}", std::string(path),
                      e.getMessage());
        return "";
    }
}

BridgeError NmBackendDbus::get_devices(std::vector<Device>& devices) {
    if (!connection_) {
        return not_started();
    }

    try {
        std::vector<sdbus::ObjectPath> paths;
        nm_proxy_->callMethod("GetAllDevices").onInterface(NM_IFACE).storeResultsTo(paths);

        devices.clear();
        for (const auto& path : paths) {
            devices.push_back(read_device(path));
        }
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::SERVICE_ERROR, "Querying devices");
    }

    spdlog::debug("[NmBackendDbus] Found {} devices", devices.size());
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendDbus::get_connections(std::vector<ConnectionProfile>& connections) {
    if (!connection_) {
        return not_started();
    }

    try {
        std::set<std::string> active_uuids;
        auto active_paths = nm_proxy_->getProperty("ActiveConnections")
                                .onInterface(NM_IFACE)
                                .get<std::vector<sdbus::ObjectPath>>();
        for (const auto& path : active_paths) {
            try {
                auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, path);
                active_uuids.insert(
                    proxy->getProperty("Uuid").onInterface(NM_ACTIVE_IFACE).get<std::string>());
            } catch (const sdbus::Error& e) {
                spdlog::debug("[NmBackendDbus] Skipping active connection {}: {}",
                              std::string(path), e.getMessage());
            }
        }

        std::vector<sdbus::ObjectPath> paths;
        settings_proxy_->callMethod("ListConnections")
            .onInterface(NM_SETTINGS_IFACE)
            .storeResultsTo(paths);

        connections.clear();
        for (const auto& path : paths) {
            NmSettings settings;
            try {
                auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, path);
                proxy->callMethod("GetSettings")
                    .onInterface(NM_CONNECTION_IFACE)
                    .storeResultsTo(settings);
            } catch (const sdbus::Error& e) {
                if (is_unreachable_error(e.getName())) {
                    throw;
                }
                // Deleted between ListConnections and GetSettings
                spdlog::debug("[NmBackendDbus] Skipping connection {}: {}", std::string(path),
                              e.getMessage());
                continue;
            }

            ConnectionProfile profile = settings_to_profile(settings);
            profile.active = active_uuids.count(profile.uuid) > 0;
            connections.push_back(std::move(profile));
        }
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::SERVICE_ERROR, "Querying connections");
    }

    spdlog::debug("[NmBackendDbus] Found {} connection profiles", connections.size());
    return BridgeError(BridgeResult::SUCCESS);
}

std::optional<Ipv4Config> NmBackendDbus::get_live_ipv4(const std::string& interface) {
    if (!connection_ || interface.empty()) {
        return std::nullopt;
    }

    try {
        sdbus::ObjectPath device;
        nm_proxy_->callMethod("GetDeviceByIpIface")
            .onInterface(NM_IFACE)
            .withArguments(interface)
            .storeResultsTo(device);

        auto dev_proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, device);
        auto ip4 =
            dev_proxy->getProperty("Ip4Config").onInterface(NM_DEVICE_IFACE).get<sdbus::ObjectPath>();
        if (ip4 == NO_OBJECT) {
            return std::nullopt;
        }

        auto ip4_proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, ip4);
        Ipv4Config config;

        auto addresses =
            ip4_proxy->getProperty("AddressData").onInterface(NM_IP4_IFACE).get<std::vector<VariantDict>>();
        for (const auto& entry : addresses) {
            auto addr = entry.find("address");
            auto prefix = entry.find("prefix");
            if (addr == entry.end()) {
                continue;
            }
            std::string cidr = addr->second.get<std::string>();
            if (prefix != entry.end()) {
                cidr += "/" + std::to_string(prefix->second.get<uint32_t>());
            }
            config.addresses.push_back(cidr);
        }

        config.gateway = ip4_proxy->getProperty("Gateway").onInterface(NM_IP4_IFACE).get<std::string>();

        auto nameservers =
            ip4_proxy->getProperty("Nameservers").onInterface(NM_IP4_IFACE).get<std::vector<uint32_t>>();
        for (uint32_t ns : nameservers) {
            config.dns.push_back(ipv4_to_string(ns));
        }

        return config;
    } catch (const sdbus::Error& e) {
        spdlog::debug("[NmBackendDbus] No live IPv4 config for {}: {}", interface, e.getMessage());
        return std::nullopt;
    }
}

// ============================================================================
// Mutations
// ============================================================================

sdbus::ObjectPath NmBackendDbus::connection_path(const std::string& uuid) {
    sdbus::ObjectPath path;
    settings_proxy_->callMethod("GetConnectionByUuid")
        .onInterface(NM_SETTINGS_IFACE)
        .withArguments(uuid)
        .storeResultsTo(path);
    return path;
}

BridgeError NmBackendDbus::add_connection(const ConnectionProfile& profile) {
    if (!connection_) {
        return not_started();
    }

    try {
        NmSettings settings = profile_to_settings(profile);
        sdbus::ObjectPath path;
        settings_proxy_->callMethod("AddConnection")
            .onInterface(NM_SETTINGS_IFACE)
            .withArguments(settings)
            .storeResultsTo(path);
        spdlog::debug("[NmBackendDbus] Added profile {} at {}", profile.id, std::string(path));
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::SERVICE_ERROR, "Adding profile '" + profile.id + "'");
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendDbus::delete_connection(const std::string& uuid) {
    if (!connection_) {
        return not_started();
    }

    sdbus::ObjectPath path;
    try {
        path = connection_path(uuid);
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::CONNECTION_NOT_FOUND, "Looking up connection " + uuid);
    }

    try {
        auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, path);
        proxy->callMethod("Delete").onInterface(NM_CONNECTION_IFACE);
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::SERVICE_ERROR, "Deleting connection " + uuid);
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendDbus::activate_connection(const std::string& uuid) {
    if (!connection_) {
        return not_started();
    }

    sdbus::ObjectPath path;
    try {
        path = connection_path(uuid);
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::CONNECTION_NOT_FOUND, "Looking up connection " + uuid);
    }

    try {
        sdbus::ObjectPath active;
        nm_proxy_->callMethod("ActivateConnection")
            .onInterface(NM_IFACE)
            .withArguments(path, sdbus::ObjectPath(NO_OBJECT), sdbus::ObjectPath(NO_OBJECT))
            .storeResultsTo(active);
        spdlog::debug("[NmBackendDbus] Activation of {} started: {}", uuid, std::string(active));
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::ACTIVATION_FAILED, "Activating connection " + uuid);
    }
    return BridgeError(BridgeResult::SUCCESS);
}

BridgeError NmBackendDbus::deactivate_connection(const std::string& uuid) {
    if (!connection_) {
        return not_started();
    }

    try {
        auto active_paths = nm_proxy_->getProperty("ActiveConnections")
                                .onInterface(NM_IFACE)
                                .get<std::vector<sdbus::ObjectPath>>();
        for (const auto& active : active_paths) {
            auto proxy = sdbus::createProxy(*connection_, NM_BUS_NAME, active);
            if (proxy->getProperty("Uuid").onInterface(NM_ACTIVE_IFACE).get<std::string>() != uuid) {
                continue;
            }
            nm_proxy_->callMethod("DeactivateConnection").onInterface(NM_IFACE).withArguments(active);
            return BridgeError(BridgeResult::SUCCESS);
        }
    } catch (const sdbus::Error& e) {
        return map_error(e, BridgeResult::ACTIVATION_FAILED, "Deactivating connection " + uuid);
    }

    return BridgeError(BridgeResult::ACTIVATION_FAILED, "no active connection for " + uuid,
                       "Connection " + uuid + " is not active");
}

} // namespace vbridge
