// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief Mock WiFi network with password for testing
 *
 * Extends the public scan record with the expected password. Real backends
 * never store passwords; they're only needed for mock authentication.
 */
struct MockWiFiNetwork {
    DiscoveredNetwork network; ///< Public scan record
    std::string password;      ///< Expected password (empty for open networks)

    MockWiFiNetwork(const std::string& ssid, const std::string& bssid, int channel, int strength,
                    const std::string& security, const std::string& pass = "")
        : network(ssid, bssid, channel, strength, security), password(pass) {}

    bool is_secured() const {
        return !password.empty();
    }
};

/**
 * @brief Mock WiFi backend for development without WiFi hardware
 *
 * Runs no external commands:
 * - Static list of networks with varying signal strength
 * - Connect succeeds when the password matches, otherwise reports `false`
 * - Radio state is controllable through set_radio_enabled()
 */
class WifiBackendMock : public WifiBackend {
  public:
    explicit WifiBackendMock(const std::string& interface_name = "wlan0");

    const char* name() const override {
        return "mock";
    }

    WiFiError connect_network(const std::string& ssid, const std::string& password,
                              bool& activated) override;
    WiFiError disconnect_network(bool& disconnected) override;
    WiFiError scan(std::vector<DiscoveredNetwork>& networks) override;

    const WirelessInterface& get_interface() const override {
        return interface_;
    }

    void set_radio_enabled(bool enabled) {
        gate_.set_enabled(enabled);
    }

  private:
    WirelessInterface interface_;
    StaticRadioGate gate_;
    std::vector<MockWiFiNetwork> mock_networks_;

    void init_mock_networks();
};

} // namespace wlanctl
