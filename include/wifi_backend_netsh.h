// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <memory>
#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief WiFi backend using the Windows `netsh wlan` tool
 *
 * Commands go through the injected ProcessExecutor, so on a POSIX build
 * the tool path points at `netsh.exe` reachable from the host (WSL interop).
 *
 * netsh joins networks by profile name only, so connect first provisions a
 * profile: the WLAN profile template is rendered for the SSID/password,
 * written to a temporary file and registered with
 * `netsh wlan add profile filename=<path>`. The file is removed afterwards.
 *
 * Commands:
 * - connect:    netsh wlan connect name=<ssid>   ("completed successfully")
 * - disconnect: netsh wlan disconnect            ("disconnect")
 * - scan:       netsh wlan show networks mode=bssid
 */
class WifiBackendNetsh : public WifiBackend {
  public:
    static constexpr const char* CONNECT_MARKER = "completed successfully";
    static constexpr const char* DISCONNECT_MARKER = "disconnect";

    WifiBackendNetsh(const std::string& interface_name, ProcessExecutor& executor,
                     std::unique_ptr<RadioGate> gate, const std::string& netsh = "netsh");

    const char* name() const override {
        return "netsh";
    }

    WiFiError connect_network(const std::string& ssid, const std::string& password,
                              bool& activated) override;
    WiFiError disconnect_network(bool& disconnected) override;
    WiFiError scan(std::vector<DiscoveredNetwork>& networks) override;

    const WirelessInterface& get_interface() const override {
        return interface_;
    }

  private:
    WirelessInterface interface_;
    ProcessExecutor& executor_;
    std::unique_ptr<RadioGate> gate_;
    std::string netsh_;

    /**
     * @brief Write and register the profile for ssid
     * @return PROFILE_CREATION_FAILED if the file or the command failed
     */
    WiFiError add_profile(const std::string& ssid, const std::string& password);
};

} // namespace wlanctl
