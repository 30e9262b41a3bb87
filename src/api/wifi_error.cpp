// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_error.h"

namespace wlanctl {

const char* wifi_result_name(WiFiResult result) {
    switch (result) {
    case WiFiResult::SUCCESS:
        return "success";
    case WiFiResult::RADIO_DISABLED:
        return "radio_disabled";
    case WiFiResult::RADIO_QUERY_FAILED:
        return "radio_query_failed";
    case WiFiResult::PROFILE_CREATION_FAILED:
        return "profile_creation_failed";
    case WiFiResult::CONNECT_EXECUTION_FAILED:
        return "connect_execution_failed";
    case WiFiResult::DISCONNECT_EXECUTION_FAILED:
        return "disconnect_execution_failed";
    case WiFiResult::SCAN_EXECUTION_FAILED:
        return "scan_execution_failed";
    case WiFiResult::INVALID_PARAMETERS:
        return "invalid_parameters";
    case WiFiResult::NETWORK_NOT_FOUND:
        return "network_not_found";
    case WiFiResult::UNKNOWN_ERROR:
        return "unknown_error";
    }
    return "unknown_error";
}

} // namespace wlanctl
