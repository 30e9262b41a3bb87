// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "radio_gate.h"

#include "utils/text_utils.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace wlanctl {

WiFiError NmcliRadioGate::is_enabled(bool& enabled) {
    ProcessOutput out = executor_.run(nmcli_, {"radio", "wifi"});
    if (!out.spawned) {
        return WiFiErrorHelper::radio_query_failed(out.error);
    }

    std::string state = trim(out.stdout_text);
    if (state == "enabled") {
        enabled = true;
    } else if (state == "disabled") {
        enabled = false;
    } else {
        return WiFiErrorHelper::radio_query_failed("Unexpected 'nmcli radio wifi' output: '" +
                                                   state + "'");
    }

    spdlog::debug("[RadioGate] nmcli: radio {}", state);
    return WiFiErrorHelper::success();
}

WiFiError RfkillRadioGate::is_enabled(bool& enabled) {
    enabled = true;

    std::error_code ec;
    if (!fs::exists(sysfs_root_, ec)) {
        spdlog::debug("[RadioGate] rfkill: {} not present, assuming enabled", sysfs_root_);
        return WiFiErrorHelper::success();
    }

    try {
        for (const auto& entry : fs::directory_iterator(sysfs_root_)) {
            std::ifstream type_stream(entry.path() / "type");
            std::string type;
            if (!(type_stream >> type) || type != "wlan") {
                continue;
            }

            // Every wlan switch counts; directory order is unspecified
            for (const char* block_file : {"soft", "hard"}) {
                std::ifstream block_stream(entry.path() / block_file);
                int blocked = 0;
                if (block_stream >> blocked && blocked == 1) {
                    spdlog::debug("[RadioGate] rfkill: {} {}-blocked",
                                  entry.path().filename().string(), block_file);
                    enabled = false;
                    return WiFiErrorHelper::success();
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        return WiFiErrorHelper::radio_query_failed(std::string("rfkill: ") + e.what());
    }

    return WiFiErrorHelper::success();
}

WiFiError NetshRadioGate::is_enabled(bool& enabled) {
    ProcessOutput out = executor_.run(netsh_, {"wlan", "show", "interfaces"});
    if (!out.spawned) {
        return WiFiErrorHelper::radio_query_failed(out.error);
    }

    const std::string& text = out.stdout_text;
    enabled = text.find("Software Off") == std::string::npos &&
              text.find("Hardware Off") == std::string::npos;

    spdlog::debug("[RadioGate] netsh: radio {}", enabled ? "on" : "off");
    return WiFiErrorHelper::success();
}

} // namespace wlanctl
