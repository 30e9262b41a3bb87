// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scan_parser.h"

#include <catch2/catch_test_macros.hpp>

using namespace wlanctl;

static const char* NMCLI_HEADER = "IN-USE  BSSID              SSID      CHAN  SIGNAL  SECURITY\n";

// ============================================================================
// Basic Records
// ============================================================================

TEST_CASE("nmcli scan: single network", "[scan][nmcli]") {
    std::string output = std::string(NMCLI_HEADER) + "AA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\n";

    auto networks = parse_nmcli_wifi_list(output);

    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0].ssid == "HomeNet");
    REQUIRE(networks[0].bssid == "AA:BB:CC:DD:EE:FF");
    REQUIRE(networks[0].channel == 6);
    REQUIRE(networks[0].signal_level == 80);
    REQUIRE(networks[0].security == "WPA2");
    REQUIRE_FALSE(networks[0].in_use);
}

TEST_CASE("nmcli scan: asterisk marks in-use network", "[scan][nmcli]") {
    std::string output = std::string(NMCLI_HEADER) + "* AA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\n";

    auto networks = parse_nmcli_wifi_list(output);

    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0] == DiscoveredNetwork("HomeNet", "AA:BB:CC:DD:EE:FF", 6, 80, "WPA2", true));
}

TEST_CASE("nmcli scan: keeps output order", "[scan][nmcli]") {
    std::string output = std::string(NMCLI_HEADER) +
                         "        11:11:11:11:11:11  Alpha   1   30  WPA2\n"
                         "*       22:22:22:22:22:22  Bravo   6   90  WPA2\n"
                         "        33:33:33:33:33:33  Charlie 11  60  --\n";

    auto networks = parse_nmcli_wifi_list(output);

    REQUIRE(networks.size() == 3);
    REQUIRE(networks[0].ssid == "Alpha");
    REQUIRE(networks[1].ssid == "Bravo");
    REQUIRE(networks[1].in_use);
    REQUIRE(networks[2].ssid == "Charlie");
    REQUIRE(networks[2].security == "--");
}

// ============================================================================
// Header and Empty Input
// ============================================================================

TEST_CASE("nmcli scan: header handling", "[scan][nmcli]") {
    SECTION("empty output") {
        REQUIRE(parse_nmcli_wifi_list("").empty());
    }

    SECTION("header only") {
        REQUIRE(parse_nmcli_wifi_list(NMCLI_HEADER).empty());
    }

    SECTION("first line is always discarded") {
        // Looks like a record but sits where the header goes
        auto networks = parse_nmcli_wifi_list("AA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\n");
        REQUIRE(networks.empty());
    }

    SECTION("repeated header lines are skipped") {
        std::string output = std::string(NMCLI_HEADER) + NMCLI_HEADER +
                             "AA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\n";
        auto networks = parse_nmcli_wifi_list(output);
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].ssid == "HomeNet");
    }

    SECTION("blank lines are ignored") {
        std::string output =
            std::string(NMCLI_HEADER) + "\n   \nAA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\n\n";
        REQUIRE(parse_nmcli_wifi_list(output).size() == 1);
    }
}

// ============================================================================
// Security Column
// ============================================================================

TEST_CASE("nmcli scan: security column variants", "[scan][nmcli]") {
    SECTION("missing security leaves it empty") {
        auto networks =
            parse_nmcli_wifi_list(std::string(NMCLI_HEADER) + "AA:BB:CC:DD:EE:FF Open 1 40\n");
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].security.empty());
    }

    SECTION("second security token replaces the first") {
        auto networks = parse_nmcli_wifi_list(std::string(NMCLI_HEADER) +
                                              "AA:BB:CC:DD:EE:FF Cafe 11 42 WPA1 WPA2\n");
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].security == "WPA2");
    }
}

// ============================================================================
// Malformed Lines
// ============================================================================

TEST_CASE("nmcli scan: malformed lines are skipped", "[scan][nmcli][edge]") {
    SECTION("too few columns") {
        std::string output = std::string(NMCLI_HEADER) + "AA:BB:CC:DD:EE:FF HomeNet 6\n" +
                             "* AA:BB:CC:DD:EE:FF HomeNet\n" +
                             "11:22:33:44:55:66 Good 1 50 WPA2\n";
        auto networks = parse_nmcli_wifi_list(output);
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].ssid == "Good");
    }

    SECTION("non-numeric channel") {
        auto networks = parse_nmcli_wifi_list(std::string(NMCLI_HEADER) +
                                              "AA:BB:CC:DD:EE:FF Net six 80 WPA2\n");
        REQUIRE(networks.empty());
    }

    SECTION("non-numeric signal") {
        auto networks = parse_nmcli_wifi_list(std::string(NMCLI_HEADER) +
                                              "AA:BB:CC:DD:EE:FF Net 6 80% WPA2\n");
        REQUIRE(networks.empty());
    }

    SECTION("bad line does not stop later lines") {
        std::string output = std::string(NMCLI_HEADER) + "garbage\n" +
                             "AA:BB:CC:DD:EE:FF Net 6 x WPA2\n" +
                             "11:22:33:44:55:66 Later 3 33 WPA2\n";
        auto networks = parse_nmcli_wifi_list(output);
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].ssid == "Later");
    }
}

TEST_CASE("nmcli scan: CRLF line endings", "[scan][nmcli][edge]") {
    std::string output = "IN-USE BSSID SSID CHAN SIGNAL SECURITY\r\n"
                         "AA:BB:CC:DD:EE:FF HomeNet 6 80 WPA2\r\n";

    auto networks = parse_nmcli_wifi_list(output);

    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0].security == "WPA2");
}

TEST_CASE("nmcli scan: signal is clamped", "[scan][nmcli][edge]") {
    std::string output = std::string(NMCLI_HEADER) + "AA:BB:CC:DD:EE:FF Loud 6 500 WPA2\n" +
                         "11:22:33:44:55:66 Quiet 6 -300 WPA2\n";

    auto networks = parse_nmcli_wifi_list(output);

    REQUIRE(networks.size() == 2);
    REQUIRE(networks[0].signal_level == SIGNAL_LEVEL_MAX);
    REQUIRE(networks[1].signal_level == SIGNAL_LEVEL_MIN);
}

TEST_CASE("clamp_signal_level: bounds", "[scan]") {
    REQUIRE(clamp_signal_level(0) == 0);
    REQUIRE(clamp_signal_level(127) == 127);
    REQUIRE(clamp_signal_level(128) == 127);
    REQUIRE(clamp_signal_level(-128) == -128);
    REQUIRE(clamp_signal_level(-129) == -128);
}
