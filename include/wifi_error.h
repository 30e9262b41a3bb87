// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace wlanctl {

/**
 * @brief WiFi operation result with detailed error information
 *
 * A command that runs but does not report success is NOT an error; backends
 * return SUCCESS and signal the negative outcome through their bool out-param.
 */
enum class WiFiResult {
    SUCCESS = 0,                 ///< Operation succeeded
    RADIO_DISABLED,              ///< Connect refused, wireless radio is off
    RADIO_QUERY_FAILED,          ///< Could not determine radio state
    PROFILE_CREATION_FAILED,     ///< Network profile could not be provisioned (netsh)
    CONNECT_EXECUTION_FAILED,    ///< Connect command could not be run
    DISCONNECT_EXECUTION_FAILED, ///< Disconnect command could not be run
    SCAN_EXECUTION_FAILED,       ///< Scan command could not be run
    INVALID_PARAMETERS,          ///< Invalid SSID, password, or other parameters
    NETWORK_NOT_FOUND,           ///< Specified network not in range
    UNKNOWN_ERROR                ///< Unexpected error condition
};

/**
 * @brief Detailed error information for WiFi operations
 */
struct WiFiError {
    WiFiResult result;         ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-friendly message for display
    std::string suggestion;    ///< Suggested action for user (optional)

    WiFiError(WiFiResult r = WiFiResult::SUCCESS, const std::string& tech = "",
              const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const {
        return result == WiFiResult::SUCCESS;
    }
    operator bool() const {
        return success();
    }
};

/**
 * @brief Stable lowercase name for a result code ("radio_disabled", ...)
 */
const char* wifi_result_name(WiFiResult result);

/**
 * @brief Utility class for creating user-friendly WiFi error messages
 */
class WiFiErrorHelper {
  public:
    static WiFiError radio_disabled(const std::string& interface_name) {
        return WiFiError(WiFiResult::RADIO_DISABLED,
                         "WiFi radio is disabled for interface " + interface_name,
                         "WiFi is disabled",
                         "Enable WiFi in system settings or check the hardware switch");
    }

    static WiFiError radio_query_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::RADIO_QUERY_FAILED, technical_detail,
                         "Unable to determine whether WiFi is enabled",
                         "Check that the WiFi service is running");
    }

    /**
     * @brief Network profile could not be written or registered
     */
    static WiFiError profile_creation_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::PROFILE_CREATION_FAILED, technical_detail,
                         "Failed to create network profile",
                         "Check permissions for the temporary directory and netsh");
    }

    static WiFiError connect_execution_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::CONNECT_EXECUTION_FAILED, technical_detail,
                         "Failed to run the connect command",
                         "Check that the network tool is installed and on PATH");
    }

    static WiFiError disconnect_execution_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::DISCONNECT_EXECUTION_FAILED, technical_detail,
                         "Failed to run the disconnect command",
                         "Check that the network tool is installed and on PATH");
    }

    static WiFiError scan_execution_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::SCAN_EXECUTION_FAILED, technical_detail,
                         "Failed to scan for networks",
                         "Check that the network tool is installed and on PATH");
    }

    static WiFiError invalid_parameters(const std::string& technical_detail) {
        return WiFiError(WiFiResult::INVALID_PARAMETERS, technical_detail, "Invalid network name",
                         "Check that the network name is correct");
    }

    static WiFiError network_not_found(const std::string& ssid) {
        return WiFiError(WiFiResult::NETWORK_NOT_FOUND, "Network not found: " + ssid,
                         "Network '" + ssid + "' is not in range",
                         "Move closer to the network or check the network name");
    }

    static WiFiError success() {
        return WiFiError(WiFiResult::SUCCESS);
    }
};

} // namespace wlanctl
