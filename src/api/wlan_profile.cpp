// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wlan_profile.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace wlanctl {

const char* const WLAN_PROFILE_TEMPLATE = R"(<?xml version="1.0"?>
<WLANProfile xmlns="http://www.microsoft.com/networking/WLAN/profile/v1">
    <name>{SSID}</name>
    <SSIDConfig>
        <SSID>
            <name>{SSID}</name>
        </SSID>
    </SSIDConfig>
    <connectionType>ESS</connectionType>
    <connectionMode>auto</connectionMode>
    <MSM>
        <security>
            <authEncryption>
                <authentication>WPA2PSK</authentication>
                <encryption>AES</encryption>
                <useOneX>false</useOneX>
            </authEncryption>
            <sharedKey>
                <keyType>passPhrase</keyType>
                <protected>false</protected>
                <keyMaterial>{password}</keyMaterial>
            </sharedKey>
        </security>
    </MSM>
</WLANProfile>
)";

const char* const WLAN_PROFILE_TEMPLATE_OPEN = R"(<?xml version="1.0"?>
<WLANProfile xmlns="http://www.microsoft.com/networking/WLAN/profile/v1">
    <name>{SSID}</name>
    <SSIDConfig>
        <SSID>
            <name>{SSID}</name>
        </SSID>
    </SSIDConfig>
    <connectionType>ESS</connectionType>
    <connectionMode>manual</connectionMode>
    <MSM>
        <security>
            <authEncryption>
                <authentication>open</authentication>
                <encryption>none</encryption>
                <useOneX>false</useOneX>
            </authEncryption>
        </security>
    </MSM>
</WLANProfile>
)";

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string render_wlan_profile(const std::string& ssid, const std::string& password) {
    std::string doc = password.empty() ? WLAN_PROFILE_TEMPLATE_OPEN : WLAN_PROFILE_TEMPLATE;
    replace_all(doc, "{SSID}", xml_escape(ssid));
    replace_all(doc, "{password}", xml_escape(password));
    return doc;
}

// ============================================================================
// ScopedTempFile
// ============================================================================

ScopedTempFile::~ScopedTempFile() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        // Use fprintf - destructor may run during static cleanup
        fprintf(stderr, "[WlanProfile] Failed to remove %s: %s\n", path_.c_str(),
                ec.message().c_str());
    }
}

WiFiError ScopedTempFile::write(const std::string& content, const std::string& suffix) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return WiFiErrorHelper::profile_creation_failed("No temp directory: " + ec.message());
    }

    std::string pattern = (dir / ("wlanctl-profile-XXXXXX" + suffix)).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    // mkstemps creates with mode 0600
    int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return WiFiErrorHelper::profile_creation_failed(std::string("mkstemps failed: ") +
                                                        strerror(errno));
    }
    path_ = name.data();

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            close(fd);
            return WiFiErrorHelper::profile_creation_failed("Write to " + path_ +
                                                            " failed: " + strerror(err));
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        return WiFiErrorHelper::profile_creation_failed("Close of " + path_ +
                                                        " failed: " + strerror(errno));
    }

    spdlog::trace("[WlanProfile] Wrote {} bytes to {}", content.size(), path_);
    return WiFiErrorHelper::success();
}

} // namespace wlanctl
