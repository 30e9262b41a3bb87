// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __WLANCTL_CONFIG_H__
#define __WLANCTL_CONFIG_H__

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <string>

namespace wlanctl {

using json = nlohmann::json;

/**
 * @brief Tool configuration manager
 *
 * Loads and manages configuration from a JSON file. Uses JSON pointer
 * syntax (RFC 6901) for nested value access.
 *
 * Keys:
 * - /interface     Wireless interface name ("wlan0")
 * - /backend       "auto", "nmcli", "netsh" or "mock"
 * - /log_level     spdlog level name, empty for default
 * - /log_dest      "auto", "journal", "syslog", "file" or "console"
 * - /log_file      Log file path for log_dest "file"
 * - /tools/nmcli   nmcli program
 * - /tools/netsh   netsh program
 *
 * Thread safety: Not thread-safe. Initialize once at startup.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 * std::string iface = cfg->get<std::string>("/interface", "wlan0");
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain the process-wide instance; tests may
     * construct their own.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist and fills in any
     * missing keys. A corrupt file is renamed to `<path>.corrupt` and
     * replaced by defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path doesn't exist or has wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of the
     * wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Written to `<path>.tmp` and renamed over the original.
     *
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    /**
     * @brief Default config file location
     *
     * `$XDG_CONFIG_HOME/wlanctl/config.json`, else `~/.config/wlanctl/config.json`,
     * else `wlanctl.json` in the working directory.
     */
    static std::string default_path();

    /**
     * @brief Default configuration document
     */
    static json get_default_config();

    static Config* get_instance();
};

} // namespace wlanctl

#endif // __WLANCTL_CONFIG_H__
