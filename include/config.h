// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __VBRIDGE_CONFIG_H__
#define __VBRIDGE_CONFIG_H__

#include "bridge_error.h"

#include "spdlog/spdlog.h"

#include <string>
#include <vector>

#include "hv/json.hpp"

namespace vbridge {

using json = nlohmann::json;

/// Default location of the optional JSON config file
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/virt-bridge-setup/config.json";

/// Environment variable overriding DEFAULT_CONFIG_PATH
constexpr const char* CONFIG_PATH_ENV = "VIRT_BRIDGE_SETUP_CONFIG";

class Config {
  private:
    std::string path;

  protected:
    json data;

    // Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();
    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    // Load config from file path; a missing file means built-in defaults.
    // The file is never written back.
    BridgeError init(const std::string& config_path);

    // Value at a JSON pointer, or default_value when it is absent or mistyped.
    // Lookups never add keys.
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data.at(ptr).template get<T>();
            } catch (const json::type_error& e) {
                spdlog::warn("[Config] {} has unexpected type ({}), using default", json_ptr,
                             e.what());
            }
        }
        return default_value;
    };

    // Get config file path
    std::string get_path();

    // Interface name prefixes never offered as bridge slaves
    std::vector<std::string> ignored_prefixes();

    // Resolve the config path: explicit flag, then environment, then default
    static std::string resolve_path(const std::string& cli_path);
};

} // namespace vbridge

#endif // __VBRIDGE_CONFIG_H__
