// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace wlanctl {

Config* Config::instance{NULL};

namespace {

/// Copy keys from defaults that are missing in data (recursing into objects)
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            spdlog::debug("[Config] Added default for '{}'", it.key());
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            modified |= merge_missing_defaults(data[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"interface", "wlan0"},
            {"backend", "auto"},
            {"log_level", ""},
            {"log_dest", "auto"},
            {"log_file", ""},
            {"tools", {{"nmcli", "nmcli"}, {"netsh", "netsh"}}}};
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/wlanctl/config.json";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/wlanctl/config.json";
    }

    return "wlanctl.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        bool parsed = false;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            parsed = data.is_object();
            if (!parsed) {
                spdlog::error("[Config] {}: root is not a JSON object", config_path);
            }
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        }

        if (!parsed) {
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;

        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] initialized: interface={} backend={}",
                  get<std::string>("/interface", "wlan0"), get<std::string>("/backend", "auto"));
}

std::string Config::get_path() {
    return path;
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string tmp_path = path + ".tmp";
    try {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();
    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Failed to move {} into place: {}", tmp_path, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace wlanctl
