// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_wifi_backend_netsh.cpp
 * @brief netsh backend: profile provisioning, connect, disconnect, scan
 */

#include "wifi_backend_netsh.h"

#include "../mocks/fake_process_executor.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

using namespace wlanctl;

namespace {

const std::string FILENAME_PREFIX = "filename=";

struct NetshFixture {
    FakeProcessExecutor exec;
    StaticRadioGate* gate = nullptr;
    std::unique_ptr<WifiBackendNetsh> backend;

    // Captured while `add profile` runs
    std::string profile_path;
    std::string profile_content;

    NetshFixture() {
        auto radio = std::make_unique<StaticRadioGate>(true);
        gate = radio.get();
        backend = std::make_unique<WifiBackendNetsh>("Wi-Fi", exec, std::move(radio));

        exec.on_run([this](const RecordedCall& call) {
            for (const auto& arg : call.args) {
                if (arg.compare(0, FILENAME_PREFIX.size(), FILENAME_PREFIX) == 0) {
                    profile_path = arg.substr(FILENAME_PREFIX.size());
                    std::ifstream in(profile_path);
                    profile_content.assign(std::istreambuf_iterator<char>(in),
                                           std::istreambuf_iterator<char>());
                }
            }
        });
    }
};

} // namespace

// ============================================================================
// Connect
// ============================================================================

TEST_CASE("netsh backend: connect provisions profile then joins", "[wifi][netsh][connect]") {
    NetshFixture f;
    f.exec.respond("add profile", "Profile Office is added on interface Wi-Fi.\n");
    f.exec.respond("wlan connect", "Connection request was completed successfully.\n");
    bool activated = false;

    WiFiError err = f.backend->connect_network("Office", "hunter22", activated);

    REQUIRE(err.success());
    REQUIRE(activated);
    REQUIRE(f.backend->get_interface().connection->ssid == "Office");

    REQUIRE(f.exec.calls.size() == 2);
    REQUIRE(f.exec.calls[0].program == "netsh");
    REQUIRE(f.exec.calls[0].args.size() == 4);
    REQUIRE(f.exec.calls[0].args[0] == "wlan");
    REQUIRE(f.exec.calls[0].args[1] == "add");
    REQUIRE(f.exec.calls[0].args[2] == "profile");
    REQUIRE(f.exec.calls[1].args == std::vector<std::string>{"wlan", "connect", "name=Office"});

    SECTION("profile file holds the rendered document") {
        REQUIRE(f.profile_content.find("<name>Office</name>") != std::string::npos);
        REQUIRE(f.profile_content.find("<keyMaterial>hunter22</keyMaterial>") !=
                std::string::npos);
    }

    SECTION("profile file is removed afterwards") {
        REQUIRE_FALSE(f.profile_path.empty());
        REQUIRE_FALSE(std::filesystem::exists(f.profile_path));
    }
}

TEST_CASE("netsh backend: connect result interpretation", "[wifi][netsh][connect]") {
    NetshFixture f;
    bool activated = false;

    SECTION("no success marker reports not activated") {
        f.exec.respond("wlan connect",
                       "There is no profile \"Office\" assigned to the specified interface.\n", 1);
        WiFiError err = f.backend->connect_network("Office", "hunter22", activated);
        REQUIRE(err.success());
        REQUIRE_FALSE(activated);
        REQUIRE_FALSE(f.backend->get_interface().is_connected());
    }

    SECTION("add profile nonzero exit still attempts connect") {
        f.exec.respond("add profile", "The parameter is incorrect.\n", 87);
        f.exec.respond("wlan connect", "Connection request was completed successfully.\n");
        WiFiError err = f.backend->connect_network("Office", "hunter22", activated);
        REQUIRE(err.success());
        REQUIRE(activated);
        REQUIRE(f.exec.calls.size() == 2);
    }

    SECTION("add profile spawn failure stops before connect") {
        f.exec.fail("add profile", "execvp() failed: No such file or directory");
        WiFiError err = f.backend->connect_network("Office", "hunter22", activated);
        REQUIRE(err.result == WiFiResult::PROFILE_CREATION_FAILED);
        REQUIRE_FALSE(activated);
        REQUIRE(f.exec.calls.size() == 1);
        REQUIRE_FALSE(std::filesystem::exists(f.profile_path));
    }

    SECTION("connect spawn failure is an error") {
        f.exec.fail("wlan connect", "fork() failed");
        WiFiError err = f.backend->connect_network("Office", "hunter22", activated);
        REQUIRE(err.result == WiFiResult::CONNECT_EXECUTION_FAILED);
        REQUIRE_FALSE(activated);
    }
}

TEST_CASE("netsh backend: open network uses open profile", "[wifi][netsh][connect]") {
    NetshFixture f;
    bool activated = false;

    REQUIRE(f.backend->connect_network("Cafe", "", activated).success());

    REQUIRE(f.profile_content.find("<authentication>open</authentication>") != std::string::npos);
    REQUIRE(f.profile_content.find("keyMaterial") == std::string::npos);
}

TEST_CASE("netsh backend: connect preconditions run no command", "[wifi][netsh][connect]") {
    NetshFixture f;
    bool activated = false;

    SECTION("radio disabled") {
        f.gate->set_enabled(false);
        WiFiError err = f.backend->connect_network("Office", "hunter22", activated);
        REQUIRE(err.result == WiFiResult::RADIO_DISABLED);
        REQUIRE(f.exec.calls.empty());
    }

    SECTION("invalid SSID") {
        WiFiError err = f.backend->connect_network(std::string(256, 'x'), "", activated);
        REQUIRE(err.result == WiFiResult::INVALID_PARAMETERS);
        REQUIRE(f.exec.calls.empty());
    }
}

TEST_CASE("netsh backend: radio gate from show interfaces", "[wifi][netsh][radio]") {
    FakeProcessExecutor exec;
    WifiBackendNetsh backend("Wi-Fi", exec, std::make_unique<NetshRadioGate>(exec));
    bool activated = false;

    exec.respond("show interfaces", "    Radio status           : Hardware On\n"
                                    "                             Software Off\n");
    WiFiError err = backend.connect_network("Office", "hunter22", activated);

    REQUIRE(err.result == WiFiResult::RADIO_DISABLED);
    REQUIRE(exec.calls.size() == 1);
}

// ============================================================================
// Disconnect
// ============================================================================

TEST_CASE("netsh backend: disconnect", "[wifi][netsh][disconnect]") {
    NetshFixture f;
    bool disconnected = false;

    SECTION("marker clears recorded connection") {
        f.exec.respond("wlan connect", "Connection request was completed successfully.\n");
        f.exec.respond("wlan disconnect",
                       "Interface \"Wi-Fi\": disconnect request was completed successfully.\n");
        bool activated = false;
        REQUIRE(f.backend->connect_network("Office", "hunter22", activated).success());
        REQUIRE(activated);

        REQUIRE(f.backend->disconnect_network(disconnected).success());
        REQUIRE(disconnected);
        REQUIRE_FALSE(f.backend->get_interface().is_connected());
        REQUIRE(f.exec.calls.back().args == std::vector<std::string>{"wlan", "disconnect"});
    }

    SECTION("no marker reports false") {
        f.exec.respond("wlan disconnect", "The wireless local area network interface is "
                                          "powered down.\n");
        REQUIRE(f.backend->disconnect_network(disconnected).success());
        REQUIRE_FALSE(disconnected);
    }

    SECTION("spawn failure is an error") {
        f.exec.fail("wlan disconnect", "fork() failed");
        REQUIRE(f.backend->disconnect_network(disconnected).result ==
                WiFiResult::DISCONNECT_EXECUTION_FAILED);
    }
}

// ============================================================================
// Scan
// ============================================================================

TEST_CASE("netsh backend: scan", "[wifi][netsh][scan]") {
    NetshFixture f;
    std::vector<DiscoveredNetwork> networks;

    SECTION("argument vector and parsed output") {
        f.exec.respond("show networks", "SSID 1 : Office\n"
                                        "    Authentication          : WPA2-Personal\n"
                                        "    BSSID 1                 : 11:22:33:44:55:66\n"
                                        "         Signal             : 72%\n"
                                        "         Channel            : 10\n");
        REQUIRE(f.backend->scan(networks).success());
        REQUIRE(f.exec.calls[0].args ==
                std::vector<std::string>{"wlan", "show", "networks", "mode=bssid"});
        REQUIRE(networks.size() == 1);
        REQUIRE(networks[0].ssid == "Office");
        REQUIRE(networks[0].signal_level == 72);
    }

    SECTION("spawn failure is an error") {
        f.exec.fail("show networks", "execvp() failed");
        REQUIRE(f.backend->scan(networks).result == WiFiResult::SCAN_EXECUTION_FAILED);
    }
}
