// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend.h"

#include "utils/text_utils.h"
#include "wifi_backend_mock.h"
#include "wifi_backend_netsh.h"
#include "wifi_backend_nmcli.h"

#include <spdlog/spdlog.h>

namespace wlanctl {

bool parse_backend_kind(const std::string& name, BackendKind& kind) {
    if (name == "auto") {
        kind = BackendKind::Auto;
    } else if (name == "nmcli") {
        kind = BackendKind::Nmcli;
    } else if (name == "netsh") {
        kind = BackendKind::Netsh;
    } else if (name == "mock") {
        kind = BackendKind::Mock;
    } else {
        return false;
    }
    return true;
}

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
    case BackendKind::Auto:
        return "auto";
    case BackendKind::Nmcli:
        return "nmcli";
    case BackendKind::Netsh:
        return "netsh";
    case BackendKind::Mock:
        return "mock";
    }
    return "unknown";
}

WiFiError check_connect_preconditions(const std::string& ssid, const std::string& password,
                                      RadioGate& gate, const std::string& interface_name) {
    std::string reason;
    if (!validate_tool_argument(ssid, false, reason)) {
        spdlog::error("[WifiBackend] Invalid SSID: {}", reason);
        return WiFiErrorHelper::invalid_parameters("SSID " + reason);
    }
    if (!validate_tool_argument(password, true, reason)) {
        spdlog::error("[WifiBackend] Invalid password: {}", reason);
        return WiFiError(WiFiResult::INVALID_PARAMETERS, "Password " + reason, "Invalid password",
                         "Check the network password and try again");
    }

    bool enabled = false;
    WiFiError gate_result = gate.is_enabled(enabled);
    if (!gate_result.success()) {
        spdlog::warn("[WifiBackend] Radio state query failed: {}", gate_result.technical_msg);
        return gate_result;
    }
    if (!enabled) {
        spdlog::warn("[WifiBackend] Radio disabled on {}, refusing connect", interface_name);
        return WiFiErrorHelper::radio_disabled(interface_name);
    }

    return WiFiErrorHelper::success();
}

std::unique_ptr<WifiBackend> WifiBackend::create(const BackendOptions& options,
                                                 ProcessExecutor& executor) {
    BackendKind kind = options.kind;
    if (kind == BackendKind::Auto) {
        kind = BackendKind::Nmcli;
        spdlog::debug("[WifiBackend] Auto-selected {} backend", backend_kind_name(kind));
    }

    switch (kind) {
    case BackendKind::Netsh:
        spdlog::debug("[WifiBackend] Creating netsh backend for '{}'", options.interface_name);
        return std::make_unique<WifiBackendNetsh>(
            options.interface_name, executor,
            std::make_unique<NetshRadioGate>(executor, options.netsh_path), options.netsh_path);
    case BackendKind::Mock:
        spdlog::debug("[WifiBackend] Creating mock backend for '{}'", options.interface_name);
        return std::make_unique<WifiBackendMock>(options.interface_name);
    case BackendKind::Nmcli:
    case BackendKind::Auto:
        break;
    }

    spdlog::debug("[WifiBackend] Creating nmcli backend for '{}'", options.interface_name);
    return std::make_unique<WifiBackendNmcli>(
        options.interface_name, executor,
        std::make_unique<NmcliRadioGate>(executor, options.nmcli_path), options.nmcli_path);
}

} // namespace wlanctl
