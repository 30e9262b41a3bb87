// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_json.h"

#include <catch2/catch_test_macros.hpp>

using namespace wlanctl;

TEST_CASE("DiscoveredNetwork JSON", "[json]") {
    DiscoveredNetwork net("HomeNet", "AA:BB:CC:DD:EE:FF", 6, 80, "WPA2", true);

    SECTION("field names") {
        json j = net;
        REQUIRE(j["ssid"] == "HomeNet");
        REQUIRE(j["bssid"] == "AA:BB:CC:DD:EE:FF");
        REQUIRE(j["channel"] == 6);
        REQUIRE(j["signal_level"] == 80);
        REQUIRE(j["security"] == "WPA2");
        REQUIRE(j["in_use"] == true);
    }

    SECTION("parses back to an equal record") {
        json j = net;
        REQUIRE(j.get<DiscoveredNetwork>() == net);
    }

    SECTION("missing keys take defaults") {
        auto parsed = json{{"ssid", "Partial"}}.get<DiscoveredNetwork>();
        REQUIRE(parsed.ssid == "Partial");
        REQUIRE(parsed.bssid.empty());
        REQUIRE(parsed.channel == 0);
        REQUIRE_FALSE(parsed.in_use);
    }

    SECTION("list serializes as array") {
        std::vector<DiscoveredNetwork> list = {net, DiscoveredNetwork()};
        json j = list;
        REQUIRE(j.is_array());
        REQUIRE(j.size() == 2);
    }
}

TEST_CASE("WirelessInterface JSON", "[json]") {
    WirelessInterface iface("wlan0");

    SECTION("disconnected") {
        json j = iface;
        REQUIRE(j["interface"] == "wlan0");
        REQUIRE(j["connected"] == false);
        REQUIRE(j["ssid"].is_null());
    }

    SECTION("connected") {
        iface.connection = ActiveConnection{"HomeNet"};
        json j = iface;
        REQUIRE(j["connected"] == true);
        REQUIRE(j["ssid"] == "HomeNet");
    }
}

TEST_CASE("WiFiError JSON", "[json]") {
    json j = WiFiErrorHelper::radio_disabled("wlan0");

    REQUIRE(j["result"] == "radio_disabled");
    REQUIRE(j["message"].is_string());
    REQUIRE_FALSE(j["message"].get<std::string>().empty());
    REQUIRE(j.contains("technical"));
    REQUIRE(j.contains("suggestion"));
}
