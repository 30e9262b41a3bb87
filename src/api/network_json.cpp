// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_json.h"

namespace wlanctl {

void to_json(json& j, const DiscoveredNetwork& net) {
    j = json{{"ssid", net.ssid},
             {"bssid", net.bssid},
             {"channel", net.channel},
             {"signal_level", net.signal_level},
             {"security", net.security},
             {"in_use", net.in_use}};
}

void from_json(const json& j, DiscoveredNetwork& net) {
    net = DiscoveredNetwork();
    net.ssid = j.value("ssid", std::string());
    net.bssid = j.value("bssid", std::string());
    net.channel = j.value("channel", 0);
    net.signal_level = j.value("signal_level", 0);
    net.security = j.value("security", std::string());
    net.in_use = j.value("in_use", false);
}

void to_json(json& j, const WirelessInterface& iface) {
    j = json{{"interface", iface.name}, {"connected", iface.is_connected()}};
    if (iface.connection) {
        j["ssid"] = iface.connection->ssid;
    } else {
        j["ssid"] = nullptr;
    }
}

void to_json(json& j, const WiFiError& err) {
    j = json{{"result", wifi_result_name(err.result)},
             {"technical", err.technical_msg},
             {"message", err.user_msg},
             {"suggestion", err.suggestion}};
}

} // namespace wlanctl
