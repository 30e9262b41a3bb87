// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_error.h"

#include <string>

namespace wlanctl {

/**
 * @brief WLAN profile document template with {SSID} and {password} placeholders
 *
 * WPA2-Personal (AES) profile in the format accepted by
 * `netsh wlan add profile filename=<path>`.
 */
extern const char* const WLAN_PROFILE_TEMPLATE;

/// Same document for open networks (no shared key)
extern const char* const WLAN_PROFILE_TEMPLATE_OPEN;

/**
 * @brief Escape &, <, >, " and ' for use in XML text
 */
std::string xml_escape(const std::string& text);

/**
 * @brief Render the profile document for a network
 *
 * Picks the open-network template when password is empty. Values are
 * XML-escaped before substitution.
 */
std::string render_wlan_profile(const std::string& ssid, const std::string& password);

/**
 * @brief Temporary file removed when the object goes out of scope
 *
 * The profile contains the passphrase in clear text, so it only lives for
 * the duration of the `add profile` call. Created with mode 0600.
 */
class ScopedTempFile {
  public:
    ScopedTempFile() = default;
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    /**
     * @brief Create the file in the system temp directory and write content
     *
     * @return PROFILE_CREATION_FAILED on any I/O error
     */
    WiFiError write(const std::string& content, const std::string& suffix = ".xml");

    const std::string& path() const {
        return path_;
    }

  private:
    std::string path_;
};

} // namespace wlanctl
