// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_mock.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wlanctl {

WifiBackendMock::WifiBackendMock(const std::string& interface_name)
    : interface_(interface_name), gate_(true) {
    spdlog::debug("[WifiBackend] Mock backend initialized");
    init_mock_networks();
}

// ============================================================================
// Connection Management
// ============================================================================

WiFiError WifiBackendMock::connect_network(const std::string& ssid, const std::string& password,
                                           bool& activated) {
    activated = false;

    WiFiError precheck = check_connect_preconditions(ssid, password, gate_, interface_.name);
    if (!precheck.success()) {
        return precheck;
    }

    auto it = std::find_if(
        mock_networks_.begin(), mock_networks_.end(),
        [&ssid](const MockWiFiNetwork& mock_net) { return mock_net.network.ssid == ssid; });

    if (it == mock_networks_.end()) {
        spdlog::warn("[WifiBackend] Mock: Network '{}' not found in scan results", ssid);
        return WiFiErrorHelper::network_not_found(ssid);
    }

    if (it->is_secured() && password != it->password) {
        spdlog::info("[WifiBackend] Mock: Auth failed for '{}'", ssid);
        return WiFiErrorHelper::success();
    }

    interface_.connection = ActiveConnection{ssid};
    activated = true;
    spdlog::info("[WifiBackend] Mock: Connected to '{}'", ssid);
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::disconnect_network(bool& disconnected) {
    disconnected = interface_.is_connected();
    if (!disconnected) {
        spdlog::debug("[WifiBackend] Mock: disconnect_network called but not connected");
        return WiFiErrorHelper::success();
    }

    spdlog::info("[WifiBackend] Mock: Disconnecting from '{}'", interface_.connection->ssid);
    interface_.connection.reset();
    return WiFiErrorHelper::success();
}

// ============================================================================
// Scanning
// ============================================================================

WiFiError WifiBackendMock::scan(std::vector<DiscoveredNetwork>& networks) {
    networks.clear();
    networks.reserve(mock_networks_.size());

    for (const auto& mock_net : mock_networks_) {
        DiscoveredNetwork net = mock_net.network;
        net.in_use = interface_.is_connected() && interface_.connection->ssid == net.ssid;
        networks.push_back(net);
    }

    spdlog::debug("[WifiBackend] Mock: Returning {} scan results", networks.size());
    return WiFiErrorHelper::success();
}

void WifiBackendMock::init_mock_networks() {
    mock_networks_ = {
        MockWiFiNetwork("HomeNetwork-5G", "AA:BB:CC:00:00:01", 36, 92, "WPA2", "12345678"),
        MockWiFiNetwork("Office-Main", "AA:BB:CC:00:00:02", 6, 78, "WPA2", "12345678"),
        MockWiFiNetwork("CoffeeShop_Free", "AA:BB:CC:00:00:03", 1, 68, "--"),
        MockWiFiNetwork("IoT-Devices", "AA:BB:CC:00:00:04", 11, 55, "WPA1", "12345678"),
        MockWiFiNetwork("Guest-Access", "AA:BB:CC:00:00:05", 6, 48, "--"),
        MockWiFiNetwork("Neighbor-Network", "AA:BB:CC:00:00:06", 44, 38, "WPA3", "12345678"),
        MockWiFiNetwork("Distant-Router", "AA:BB:CC:00:00:07", 1, 18, "WPA2", "12345678")};

    spdlog::debug("[WifiBackend] Mock: Initialized {} mock networks", mock_networks_.size());
}

} // namespace wlanctl
