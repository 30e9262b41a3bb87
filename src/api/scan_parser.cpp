// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scan_parser.h"

#include "utils/text_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wlanctl {

int clamp_signal_level(int value) {
    int clamped = std::max(SIGNAL_LEVEL_MIN, std::min(SIGNAL_LEVEL_MAX, value));
    if (clamped != value) {
        spdlog::debug("[ScanParser] Signal {} out of range, clamped to {}", value, clamped);
    }
    return clamped;
}

// ============================================================================
// nmcli (tabular)
// ============================================================================

std::vector<DiscoveredNetwork> parse_nmcli_wifi_list(const std::string& output) {
    std::vector<DiscoveredNetwork> networks;

    auto lines = split_lines(output);
    if (lines.empty()) {
        return networks;
    }

    // lines[0] is the column header
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        auto tokens = split_whitespace(line);
        if (tokens.empty()) {
            continue;
        }

        size_t pos = 0;
        DiscoveredNetwork net;

        if (tokens[0] == "IN-USE") {
            continue;
        } else if (tokens[0] == "*") {
            net.in_use = true;
            ++pos;
        }

        // BSSID, SSID, CHAN, SIGNAL are required
        if (tokens.size() < pos + 4) {
            spdlog::debug("[ScanParser] nmcli: Skipping short line ({} tokens): {}",
                          tokens.size(), line);
            continue;
        }

        net.bssid = tokens[pos++];
        net.ssid = tokens[pos++];
        const std::string& channel_str = tokens[pos++];
        const std::string& signal_str = tokens[pos++];

        auto channel = parse_int(channel_str);
        auto signal = parse_int(signal_str);
        if (!channel || !signal) {
            spdlog::debug("[ScanParser] nmcli: Invalid channel '{}' or signal '{}' for '{}'",
                          channel_str, signal_str, net.ssid);
            continue;
        }
        net.channel = *channel;
        net.signal_level = clamp_signal_level(*signal);

        if (pos < tokens.size()) {
            net.security = tokens[pos++];
        }
        // "WPA1 WPA2": the trailing label is the more specific one
        if (pos < tokens.size() && !tokens[pos].empty()) {
            net.security = tokens[pos];
        }

        networks.push_back(std::move(net));
    }

    spdlog::debug("[ScanParser] nmcli: Parsed {} networks", networks.size());
    return networks;
}

// ============================================================================
// netsh (block)
// ============================================================================

namespace {

/// Text after the first ':' of "Key [n]   : value", trimmed
std::string value_after_separator(const std::string& line) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return "";
    }
    return trim(line.substr(colon + 1));
}

/// First whitespace token of the value part, or empty
std::string first_value_token(const std::string& line) {
    auto tokens = split_whitespace(value_after_separator(line));
    return tokens.empty() ? std::string() : tokens[0];
}

/**
 * @brief Accumulates one SSID block
 *
 * BSSID and Signal lines stage a pending access point; the Channel line
 * commits it if it is the first or strictly stronger than the current one.
 * Access points without a BSSID value are never committed.
 */
class NetshBlock {
  public:
    void set_ssid(const std::string& ssid) {
        record_.ssid = ssid;
    }

    void set_security(const std::string& security) {
        record_.security = security;
    }

    void stage_bssid(const std::string& bssid) {
        pending_bssid_ = bssid;
    }

    void stage_signal(const std::string& signal) {
        pending_signal_ = signal;
    }

    void commit_channel(const std::string& channel_str) {
        if (pending_bssid_.empty()) {
            spdlog::debug("[ScanParser] netsh: Ignoring access point with empty BSSID");
            return;
        }
        auto signal = parse_int(pending_signal_);
        if (!signal) {
            spdlog::debug("[ScanParser] netsh: Ignoring BSSID '{}' with invalid signal '{}'",
                          pending_bssid_, pending_signal_);
            return;
        }
        int level = clamp_signal_level(*signal);

        if (!has_ap_ || level > record_.signal_level) {
            record_.bssid = pending_bssid_;
            record_.signal_level = level;
            record_.channel = parse_int(channel_str).value_or(0);
            has_ap_ = true;
        }
    }

    /// Append the record if it acquired a BSSID, then reset for the next block
    void flush(std::vector<DiscoveredNetwork>& out) {
        if (!record_.bssid.empty()) {
            out.push_back(record_);
        } else if (!record_.ssid.empty()) {
            spdlog::trace("[ScanParser] netsh: Dropping '{}' (no BSSID)", record_.ssid);
        }
        *this = NetshBlock();
    }

  private:
    DiscoveredNetwork record_;
    std::string pending_bssid_;
    std::string pending_signal_ = "0";
    bool has_ap_ = false;
};

} // namespace

std::vector<DiscoveredNetwork> parse_netsh_bssid_list(const std::string& output) {
    std::vector<DiscoveredNetwork> networks;
    NetshBlock block;

    for (const auto& line : split_lines(output)) {
        auto tokens = split_whitespace(line);
        if (tokens.empty()) {
            block.flush(networks);
            continue;
        }

        const std::string& key = tokens[0];

        if (key == "Interface" || key == "There") {
            continue;
        } else if (key == "SSID") {
            block.set_ssid(value_after_separator(line));
        } else if (key == "Authentication") {
            block.set_security(value_after_separator(line));
        } else if (key == "BSSID") {
            block.stage_bssid(first_value_token(line));
        } else if (key == "Signal") {
            std::string signal = first_value_token(line);
            if (!signal.empty() && signal.back() == '%') {
                signal.pop_back();
            }
            block.stage_signal(signal.empty() ? "0" : signal);
        } else if (key == "Channel") {
            block.commit_channel(first_value_token(line));
        }
    }
    block.flush(networks);

    spdlog::debug("[ScanParser] netsh: Parsed {} networks", networks.size());
    return networks;
}

} // namespace wlanctl
