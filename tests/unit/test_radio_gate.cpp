// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "radio_gate.h"

#include "../mocks/fake_process_executor.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace wlanctl;
namespace fs = std::filesystem;

// ============================================================================
// nmcli
// ============================================================================

TEST_CASE("NmcliRadioGate: parses radio state", "[radio][nmcli]") {
    FakeProcessExecutor exec;
    NmcliRadioGate gate(exec);
    bool enabled = false;

    SECTION("enabled") {
        exec.respond("radio wifi", "enabled\n");
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
        REQUIRE(exec.calls[0].args == std::vector<std::string>{"radio", "wifi"});
    }

    SECTION("disabled") {
        enabled = true;
        exec.respond("radio wifi", "disabled\n");
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE_FALSE(enabled);
    }

    SECTION("unexpected output is a query failure") {
        exec.respond("radio wifi", "Error: NetworkManager is not running.\n", 8);
        REQUIRE(gate.is_enabled(enabled).result == WiFiResult::RADIO_QUERY_FAILED);
    }

    SECTION("spawn failure is a query failure") {
        exec.fail("radio wifi", "execvp() failed: No such file or directory");
        REQUIRE(gate.is_enabled(enabled).result == WiFiResult::RADIO_QUERY_FAILED);
    }
}

// ============================================================================
// netsh
// ============================================================================

TEST_CASE("NetshRadioGate: reads radio status lines", "[radio][netsh]") {
    FakeProcessExecutor exec;
    NetshRadioGate gate(exec);
    bool enabled = false;

    SECTION("both on") {
        exec.respond("show interfaces", "    Radio status           : Hardware On\n"
                                        "                             Software On\n");
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }

    SECTION("hardware off") {
        exec.respond("show interfaces", "    Radio status           : Hardware Off\n"
                                        "                             Software On\n");
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE_FALSE(enabled);
    }

    SECTION("spawn failure") {
        exec.fail("show interfaces", "fork() failed");
        REQUIRE(gate.is_enabled(enabled).result == WiFiResult::RADIO_QUERY_FAILED);
    }
}

// ============================================================================
// rfkill
// ============================================================================

namespace {

class RfkillTree {
  public:
    RfkillTree() {
        root_ = fs::temp_directory_path() / ("wlanctl-rfkill-" + std::to_string(getpid()));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    ~RfkillTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void add(const std::string& name, const std::string& type, int soft, int hard) {
        fs::path dir = root_ / name;
        fs::create_directories(dir);
        std::ofstream(dir / "type") << type << "\n";
        std::ofstream(dir / "soft") << soft << "\n";
        std::ofstream(dir / "hard") << hard << "\n";
    }

    std::string path() const {
        return root_.string();
    }

  private:
    fs::path root_;
};

} // namespace

TEST_CASE("RfkillRadioGate: sysfs state", "[radio][rfkill]") {
    RfkillTree tree;
    bool enabled = false;

    SECTION("unblocked wlan entry") {
        tree.add("rfkill0", "wlan", 0, 0);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }

    SECTION("soft blocked") {
        tree.add("rfkill0", "wlan", 1, 0);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE_FALSE(enabled);
    }

    SECTION("hard blocked") {
        tree.add("rfkill0", "wlan", 0, 1);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE_FALSE(enabled);
    }

    SECTION("any blocked wlan entry disables the radio") {
        tree.add("rfkill0", "wlan", 0, 0);
        tree.add("rfkill1", "bluetooth", 0, 0);
        tree.add("rfkill2", "wlan", 1, 0);
        tree.add("rfkill3", "wlan", 0, 0);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE_FALSE(enabled);
    }

    SECTION("several unblocked wlan entries") {
        tree.add("rfkill0", "wlan", 0, 0);
        tree.add("rfkill1", "wlan", 0, 0);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }

    SECTION("blocked bluetooth does not count") {
        tree.add("rfkill0", "bluetooth", 1, 1);
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }

    SECTION("empty rfkill directory") {
        RfkillRadioGate gate(tree.path());
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }

    SECTION("missing rfkill directory") {
        RfkillRadioGate gate(tree.path() + "/does-not-exist");
        REQUIRE(gate.is_enabled(enabled).success());
        REQUIRE(enabled);
    }
}

TEST_CASE("StaticRadioGate: reports configured state", "[radio]") {
    StaticRadioGate gate(false);
    bool enabled = true;

    REQUIRE(gate.is_enabled(enabled).success());
    REQUIRE_FALSE(enabled);

    gate.set_enabled(true);
    REQUIRE(gate.is_enabled(enabled).success());
    REQUIRE(enabled);
}
