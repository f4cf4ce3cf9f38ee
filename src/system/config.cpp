// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace vbridge {

namespace {

/// Default slave-selection policy - interfaces that are never bridge slaves
json get_default_ignored_prefixes() {
    return json::array({"lo", "virbr", "vnet", "docker", "p2p-dev-"});
}

/// Default values for the add command
json get_default_add_options() {
    return {{"conn_name", "c-mybr0"},
            {"bridge_ifname", "mybr0"},
            {"stp", true},
            {"multicast_snooping", true},
            {"vlan_filtering", false},
            {"clone_mac", true},
            {"auto_activate", true}};
}

/// Default root-level config
json get_default_config() {
    return {{"log_level", "info"},
            {"defaults", get_default_add_options()},
            {"slave_selection", {{"ignored_prefixes", get_default_ignored_prefixes()}}}};
}

} // namespace

Config::Config() : data(get_default_config()) {}

BridgeError Config::init(const std::string& config_path) {
    path = config_path;
    data = get_default_config();

    struct stat buffer;
    if (stat(config_path.c_str(), &buffer) != 0) {
        spdlog::debug("[Config] No config at {}, using built-in defaults", config_path);
        return BridgeError(BridgeResult::SUCCESS);
    }

    spdlog::debug("[Config] Loading config from {}", config_path);
    std::ifstream in(config_path);
    if (!in.is_open()) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, "cannot open " + config_path,
                           "Cannot read config file " + config_path);
    }

    json loaded;
    try {
        loaded = json::parse(in);
    } catch (const json::parse_error& e) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, e.what(),
                           "Malformed config file " + config_path + ": " + e.what());
    }

    if (!loaded.is_object()) {
        return BridgeError(BridgeResult::INVALID_PARAMETER, "top-level value is not an object",
                           "Malformed config file " + config_path + ": expected a JSON object");
    }

    // Keys present in the file override defaults; missing keys keep them
    data.merge_patch(loaded);

    spdlog::debug("[Config] initialized: defaults conn_name={} bridge_ifname={}",
                  get<std::string>("/defaults/conn_name", "c-mybr0"),
                  get<std::string>("/defaults/bridge_ifname", "mybr0"));
    return BridgeError(BridgeResult::SUCCESS);
}

std::string Config::get_path() {
    return path;
}

std::vector<std::string> Config::ignored_prefixes() {
    return get<std::vector<std::string>>("/slave_selection/ignored_prefixes",
                                         get_default_ignored_prefixes().get<std::vector<std::string>>());
}

std::string Config::resolve_path(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    const char* env = std::getenv(CONFIG_PATH_ENV);
    if (env && *env) {
        return env;
    }
    return DEFAULT_CONFIG_PATH;
}

} // namespace vbridge
