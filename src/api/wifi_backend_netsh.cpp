// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_netsh.h"

#include "scan_parser.h"
#include "wlan_profile.h"

#include <spdlog/spdlog.h>

namespace wlanctl {

WifiBackendNetsh::WifiBackendNetsh(const std::string& interface_name, ProcessExecutor& executor,
                                   std::unique_ptr<RadioGate> gate, const std::string& netsh)
    : interface_(interface_name), executor_(executor), gate_(std::move(gate)), netsh_(netsh) {
    spdlog::debug("[WifiBackend] Initialized (netsh mode, interface {})", interface_.name);
}

// ============================================================================
// Profile Provisioning
// ============================================================================

WiFiError WifiBackendNetsh::add_profile(const std::string& ssid, const std::string& password) {
    ScopedTempFile profile_file;
    WiFiError written = profile_file.write(render_wlan_profile(ssid, password));
    if (!written.success()) {
        spdlog::error("[WifiBackend] netsh: Could not write profile for '{}': {}", ssid,
                      written.technical_msg);
        return written;
    }

    ProcessOutput out =
        executor_.run(netsh_, {"wlan", "add", "profile", "filename=" + profile_file.path()});
    if (!out.spawned) {
        spdlog::error("[WifiBackend] netsh: add profile failed to run: {}", out.error);
        return WiFiErrorHelper::profile_creation_failed(out.error);
    }

    if (out.exit_code != 0) {
        spdlog::warn("[WifiBackend] netsh: add profile exited with code {}: {}", out.exit_code,
                     out.stdout_text);
    } else {
        spdlog::debug("[WifiBackend] netsh: Profile for '{}' added", ssid);
    }
    return WiFiErrorHelper::success();
}

// ============================================================================
// Connection Management
// ============================================================================

WiFiError WifiBackendNetsh::connect_network(const std::string& ssid, const std::string& password,
                                            bool& activated) {
    activated = false;

    WiFiError precheck = check_connect_preconditions(ssid, password, *gate_, interface_.name);
    if (!precheck.success()) {
        return precheck;
    }

    WiFiError profile = add_profile(ssid, password);
    if (!profile.success()) {
        return profile;
    }

    spdlog::info("[WifiBackend] netsh: Connecting to network '{}'", ssid);

    ProcessOutput out = executor_.run(netsh_, {"wlan", "connect", "name=" + ssid});
    if (!out.spawned) {
        spdlog::error("[WifiBackend] netsh: Connect command failed to run: {}", out.error);
        return WiFiErrorHelper::connect_execution_failed(out.error);
    }

    if (out.stdout_text.find(CONNECT_MARKER) == std::string::npos) {
        spdlog::warn("[WifiBackend] netsh: Connection request for '{}' not completed", ssid);
        spdlog::debug("[WifiBackend] netsh: Output: {}", out.stdout_text);
        return WiFiErrorHelper::success();
    }

    interface_.connection = ActiveConnection{ssid};
    activated = true;
    spdlog::info("[WifiBackend] netsh: Connected to '{}'", ssid);
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetsh::disconnect_network(bool& disconnected) {
    disconnected = false;

    spdlog::info("[WifiBackend] netsh: Disconnecting");

    ProcessOutput out = executor_.run(netsh_, {"wlan", "disconnect"});
    if (!out.spawned) {
        spdlog::error("[WifiBackend] netsh: Disconnect command failed to run: {}", out.error);
        return WiFiErrorHelper::disconnect_execution_failed(out.error);
    }

    disconnected = out.stdout_text.find(DISCONNECT_MARKER) != std::string::npos;
    if (disconnected) {
        interface_.connection.reset();
    }
    return WiFiErrorHelper::success();
}

// ============================================================================
// Scanning
// ============================================================================

WiFiError WifiBackendNetsh::scan(std::vector<DiscoveredNetwork>& networks) {
    networks.clear();

    std::vector<std::string> args = {"wlan", "show", "networks", "mode=bssid"};
    spdlog::debug("[WifiBackend] netsh: Running {}", format_command(netsh_, args));

    ProcessOutput out = executor_.run(netsh_, args);
    if (!out.spawned) {
        spdlog::error("[WifiBackend] netsh: Scan command failed to run: {}", out.error);
        return WiFiErrorHelper::scan_execution_failed(out.error);
    }

    networks = parse_netsh_bssid_list(out.stdout_text);
    spdlog::debug("[WifiBackend] netsh: Scan complete, {} networks found", networks.size());
    return WiFiErrorHelper::success();
}

} // namespace wlanctl
