// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <memory>
#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief NetworkManager WiFi backend using the nmcli command-line interface
 *
 * Commands (all run through the injected ProcessExecutor, never a shell):
 * - connect:    nmcli d wifi connect <ssid> [password <pw>] ifname <iface>
 * - disconnect: nmcli d disconnect ifname <iface>
 * - scan:       nmcli -f IN-USE,BSSID,SSID,CHAN,SIGNAL,SECURITY d wifi list
 *
 * Success is read from stdout markers, not exit codes: "successfully
 * activated" for connect and "disconnect" for disconnect.
 *
 * @see scan_parser.h for the scan output grammar
 */
class WifiBackendNmcli : public WifiBackend {
  public:
    static constexpr const char* CONNECT_MARKER = "successfully activated";
    static constexpr const char* DISCONNECT_MARKER = "disconnect";

    WifiBackendNmcli(const std::string& interface_name, ProcessExecutor& executor,
                     std::unique_ptr<RadioGate> gate, const std::string& nmcli = "nmcli");

    // ========================================================================
    // WifiBackend Interface Implementation
    // ========================================================================

    const char* name() const override {
        return "nmcli";
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
    std::string nmcli_;
};

} // namespace wlanctl
