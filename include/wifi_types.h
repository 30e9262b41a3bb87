// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

namespace wlanctl {

/**
 * @brief Network the interface is currently associated with
 */
struct ActiveConnection {
    std::string ssid; ///< Associated network name
};

/**
 * @brief A physical radio adapter and its current association
 *
 * The connection is absent until a successful connect and cleared again by a
 * successful disconnect. Owned by exactly one backend.
 */
struct WirelessInterface {
    std::string name;                           ///< Adapter name (e.g., "wlan0", "Wi-Fi")
    std::optional<ActiveConnection> connection; ///< Set while connected

    WirelessInterface() = default;
    explicit WirelessInterface(const std::string& name_) : name(name_) {}

    bool is_connected() const {
        return connection.has_value();
    }
};

/**
 * @brief One access point reported by a scan
 *
 * BSSID is the most specific identity: two records with the same SSID and
 * different BSSIDs are distinct access points. Signal units depend on the
 * platform tool (both nmcli and netsh report a 0-100 percentage).
 */
struct DiscoveredNetwork {
    std::string ssid;     ///< Network name (may be empty or shared)
    std::string bssid;    ///< Access point MAC address
    int channel;          ///< Radio channel
    int signal_level;     ///< Signal strength, clamped to [-128, 127]
    std::string security; ///< Security label (e.g., "WPA2", "WPA2-Personal")
    bool in_use;          ///< True if the interface is joined to this AP

    DiscoveredNetwork() : channel(0), signal_level(0), in_use(false) {}

    DiscoveredNetwork(const std::string& ssid_, const std::string& bssid_, int channel_,
                      int signal_, const std::string& security_, bool in_use_ = false)
        : ssid(ssid_), bssid(bssid_), channel(channel_), signal_level(signal_),
          security(security_), in_use(in_use_) {}

    bool operator==(const DiscoveredNetwork& o) const {
        return ssid == o.ssid && bssid == o.bssid && channel == o.channel &&
               signal_level == o.signal_level && security == o.security && in_use == o.in_use;
    }
    bool operator!=(const DiscoveredNetwork& o) const {
        return !(*this == o);
    }
};

} // namespace wlanctl
