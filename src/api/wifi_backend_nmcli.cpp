// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_nmcli.h"

#include "scan_parser.h"

#include <spdlog/spdlog.h>

namespace wlanctl {

WifiBackendNmcli::WifiBackendNmcli(const std::string& interface_name, ProcessExecutor& executor,
                                   std::unique_ptr<RadioGate> gate, const std::string& nmcli)
    : interface_(interface_name), executor_(executor), gate_(std::move(gate)), nmcli_(nmcli) {
    spdlog::debug("[WifiBackend] Initialized (nmcli mode, interface {})", interface_.name);
}

// ============================================================================
// Connection Management
// ============================================================================

WiFiError WifiBackendNmcli::connect_network(const std::string& ssid, const std::string& password,
                                            bool& activated) {
    activated = false;

    WiFiError precheck = check_connect_preconditions(ssid, password, *gate_, interface_.name);
    if (!precheck.success()) {
        return precheck;
    }

    spdlog::info("[WifiBackend] nmcli: Connecting to network '{}'", ssid);

    std::vector<std::string> args = {"d", "wifi", "connect", ssid};
    if (!password.empty()) {
        args.push_back("password");
        args.push_back(password);
    }
    args.push_back("ifname");
    args.push_back(interface_.name);

    ProcessOutput out = executor_.run(nmcli_, args);
    if (!out.spawned) {
        spdlog::error("[WifiBackend] nmcli: Connect command failed to run: {}", out.error);
        return WiFiErrorHelper::connect_execution_failed(out.error);
    }

    if (out.stdout_text.find(CONNECT_MARKER) == std::string::npos) {
        spdlog::warn("[WifiBackend] nmcli: Connection to '{}' not activated (exit code {})", ssid,
                     out.exit_code);
        spdlog::debug("[WifiBackend] nmcli: Output: {}", out.stdout_text);
        return WiFiErrorHelper::success();
    }

    interface_.connection = ActiveConnection{ssid};
    activated = true;
    spdlog::info("[WifiBackend] nmcli: Connected to '{}'", ssid);
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNmcli::disconnect_network(bool& disconnected) {
    disconnected = false;

    spdlog::info("[WifiBackend] nmcli: Disconnecting {}", interface_.name);

    std::vector<std::string> args = {"d", "disconnect", "ifname", interface_.name};
    spdlog::debug("[WifiBackend] nmcli: Running {}", format_command(nmcli_, args));

    ProcessOutput out = executor_.run(nmcli_, args);
    if (!out.spawned) {
        spdlog::error("[WifiBackend] nmcli: Disconnect command failed to run: {}", out.error);
        return WiFiErrorHelper::disconnect_execution_failed(out.error);
    }

    spdlog::debug("[WifiBackend] nmcli: Disconnect result: {}", out.stdout_text);
    disconnected = out.stdout_text.find(DISCONNECT_MARKER) != std::string::npos;
    if (disconnected) {
        interface_.connection.reset();
    }
    return WiFiErrorHelper::success();
}

// ============================================================================
// Scanning
// ============================================================================

WiFiError WifiBackendNmcli::scan(std::vector<DiscoveredNetwork>& networks) {
    networks.clear();

    std::vector<std::string> args = {"-f", "IN-USE,BSSID,SSID,CHAN,SIGNAL,SECURITY", "d", "wifi",
                                     "list"};
    spdlog::debug("[WifiBackend] nmcli: Running {}", format_command(nmcli_, args));

    ProcessOutput out = executor_.run(nmcli_, args);
    if (!out.spawned) {
        spdlog::error("[WifiBackend] nmcli: Scan command failed to run: {}", out.error);
        return WiFiErrorHelper::scan_execution_failed(out.error);
    }

    networks = parse_nmcli_wifi_list(out.stdout_text);
    spdlog::debug("[WifiBackend] nmcli: Scan complete, {} networks found", networks.size());
    return WiFiErrorHelper::success();
}

} // namespace wlanctl
