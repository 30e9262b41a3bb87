// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_error.h"
#include "wifi_types.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace wlanctl {

using json = nlohmann::json;

/**
 * @brief {"ssid", "bssid", "channel", "signal_level", "security", "in_use"}
 */
void to_json(json& j, const DiscoveredNetwork& net);

/**
 * @brief Inverse of to_json; missing keys take the field defaults
 *
 * @throws nlohmann::json::type_error if a present key has the wrong type
 */
void from_json(const json& j, DiscoveredNetwork& net);

/**
 * @brief {"interface", "connected", "ssid"} (ssid null while disconnected)
 */
void to_json(json& j, const WirelessInterface& iface);

/**
 * @brief {"result", "technical", "message", "suggestion"}
 */
void to_json(json& j, const WiFiError& err);

} // namespace wlanctl
