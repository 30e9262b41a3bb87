// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_types.h"

#include <string>
#include <vector>

namespace wlanctl {

/// Lowest/highest signal value a scan record may carry; parsed values are clamped.
constexpr int SIGNAL_LEVEL_MIN = -128;
constexpr int SIGNAL_LEVEL_MAX = 127;

/**
 * @brief Parse tabular nmcli output, one network per line
 *
 * Expects the output of
 * `nmcli -f IN-USE,BSSID,SSID,CHAN,SIGNAL,SECURITY d wifi list`:
 *
 *     IN-USE  BSSID              SSID      CHAN  SIGNAL  SECURITY
 *     *       AA:BB:CC:DD:EE:FF  HomeNet   6     80      WPA2
 *             11:22:33:44:55:66  Cafe      11    42      WPA1 WPA2
 *
 * The first line is discarded. A line starting with "IN-USE" (repeated
 * header) is skipped. A leading "*" marks the in-use network. When a second
 * security token follows the first, it replaces it. Lines missing BSSID,
 * SSID, channel or signal, or with non-numeric channel/signal, are skipped.
 *
 * @param output Raw command stdout
 * @return Networks in output order
 */
std::vector<DiscoveredNetwork> parse_nmcli_wifi_list(const std::string& output);

/**
 * @brief Parse netsh block output, one blank-line delimited block per SSID
 *
 * Expects the output of `netsh wlan show networks mode=bssid`:
 *
 *     SSID 1 : Office
 *         Network type            : Infrastructure
 *         Authentication          : WPA2-Personal
 *         Encryption              : CCMP
 *         BSSID 1                 : 11:22:33:44:55:66
 *              Signal             : 72%
 *              Radio type         : 802.11ac
 *              Channel            : 10
 *
 * Each block may list several BSSID/Signal/Channel triples. The record keeps
 * the triple with the highest signal; on a tie the first one seen wins. A
 * block that never commits a BSSID produces no record.
 *
 * @param output Raw command stdout
 * @return One network per block, in output order
 */
std::vector<DiscoveredNetwork> parse_netsh_bssid_list(const std::string& output);

/**
 * @brief Clamp a parsed signal value into [SIGNAL_LEVEL_MIN, SIGNAL_LEVEL_MAX]
 */
int clamp_signal_level(int value);

} // namespace wlanctl
