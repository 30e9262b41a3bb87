// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "network_json.h"
#include "process_executor.h"
#include "wifi_backend.h"
#include "wlanctl_version.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>

using namespace wlanctl;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_NOT_DONE = 1;
constexpr int EXIT_ERROR = 2;
constexpr int EXIT_USAGE = 64;

int report_error(const WiFiError& err, bool json_output) {
    if (json_output) {
        std::cout << json{{"error", err}}.dump(2) << std::endl;
    } else {
        fprintf(stderr, "Error: %s\n", err.user_msg.c_str());
        if (!err.technical_msg.empty()) {
            fprintf(stderr, "  %s\n", err.technical_msg.c_str());
        }
        if (!err.suggestion.empty()) {
            fprintf(stderr, "  %s\n", err.suggestion.c_str());
        }
    }
    return EXIT_ERROR;
}

void print_network_table(const std::vector<DiscoveredNetwork>& networks) {
    fmt::print("{:<6} {:<17} {:<32} {:>4} {:>6}  {}\n", "IN-USE", "BSSID", "SSID", "CHAN",
               "SIGNAL", "SECURITY");
    for (const auto& net : networks) {
        fmt::print("{:<6} {:<17} {:<32} {:>4} {:>6}  {}\n", net.in_use ? "*" : "", net.bssid,
                   net.ssid, net.channel, net.signal_level, net.security);
    }
}

int run_scan(WifiBackend& backend, bool json_output) {
    std::vector<DiscoveredNetwork> networks;
    WiFiError err = backend.scan(networks);
    if (!err.success()) {
        return report_error(err, json_output);
    }

    if (json_output) {
        std::cout << json(networks).dump(2) << std::endl;
    } else {
        print_network_table(networks);
    }
    return EXIT_OK;
}

int run_status(WifiBackend& backend, bool json_output) {
    std::vector<DiscoveredNetwork> networks;
    WiFiError err = backend.scan(networks);
    if (!err.success()) {
        return report_error(err, json_output);
    }

    const DiscoveredNetwork* active = nullptr;
    for (const auto& net : networks) {
        if (net.in_use) {
            active = &net;
            break;
        }
    }

    const std::string& iface = backend.get_interface().name;
    if (json_output) {
        json j = {{"interface", iface}, {"connected", active != nullptr}};
        j["network"] = active ? json(*active) : json(nullptr);
        std::cout << j.dump(2) << std::endl;
    } else if (active) {
        fmt::print("{}: connected to '{}' ({}, channel {}, signal {})\n", iface, active->ssid,
                   active->bssid, active->channel, active->signal_level);
    } else {
        fmt::print("{}: not connected\n", iface);
    }
    return active ? EXIT_OK : EXIT_NOT_DONE;
}

int run_connect(WifiBackend& backend, const CliArgs& args) {
    bool activated = false;
    WiFiError err = backend.connect_network(args.ssid, args.password, activated);
    if (!err.success()) {
        return report_error(err, args.json_output);
    }

    if (args.json_output) {
        std::cout << json{{"activated", activated}, {"status", backend.get_interface()}}.dump(2)
                  << std::endl;
    } else if (activated) {
        fmt::print("Connected to '{}'\n", args.ssid);
    } else {
        fmt::print("Connection to '{}' was not activated\n", args.ssid);
    }
    return activated ? EXIT_OK : EXIT_NOT_DONE;
}

int run_disconnect(WifiBackend& backend, bool json_output) {
    bool disconnected = false;
    WiFiError err = backend.disconnect_network(disconnected);
    if (!err.success()) {
        return report_error(err, json_output);
    }

    if (json_output) {
        std::cout << json{{"disconnected", disconnected}, {"status", backend.get_interface()}}
                         .dump(2)
                  << std::endl;
    } else {
        fmt::print("{}\n", disconnected ? "Disconnected" : "Disconnect was not confirmed");
    }
    return disconnected ? EXIT_OK : EXIT_NOT_DONE;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
        return EXIT_USAGE;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.show_version) {
        printf("wlanctl %s\n", WLANCTL_VERSION);
        return EXIT_OK;
    }

    // Console-only logging until config tells us where logs go
    logging::LogConfig early_log;
    early_log.level = logging::verbosity_to_level(args.verbosity);
    logging::init(early_log);

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_path() : args.config_path);

    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config->get<std::string>("/log_level", ""));
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config->get<std::string>("/log_dest", "auto") : args.log_dest);
    log_config.file_path =
        args.log_file.empty() ? config->get<std::string>("/log_file", "") : args.log_file;
    logging::init(log_config);

    BackendOptions options;
    options.interface_name = args.interface_name.empty()
                                 ? config->get<std::string>("/interface", "wlan0")
                                 : args.interface_name;
    options.nmcli_path = config->get<std::string>("/tools/nmcli", "nmcli");
    options.netsh_path = config->get<std::string>("/tools/netsh", "netsh");

    std::string backend_name =
        args.backend.empty() ? config->get<std::string>("/backend", "auto") : args.backend;
    if (!parse_backend_kind(backend_name, options.kind)) {
        spdlog::warn("[Main] Unknown backend '{}' in config, using auto", backend_name);
        options.kind = BackendKind::Auto;
    }

    PosixProcessExecutor executor;
    std::unique_ptr<WifiBackend> backend = WifiBackend::create(options, executor);
    spdlog::info("[Main] {} on {} via {} backend", command_name(args.command),
                 options.interface_name, backend->name());

    switch (args.command) {
    case Command::SCAN:
        return run_scan(*backend, args.json_output);
    case Command::STATUS:
        return run_status(*backend, args.json_output);
    case Command::CONNECT:
        return run_connect(*backend, args);
    case Command::DISCONNECT:
        return run_disconnect(*backend, args.json_output);
    case Command::NONE:
        break;
    }

    print_help(argv[0]);
    return EXIT_USAGE;
}
