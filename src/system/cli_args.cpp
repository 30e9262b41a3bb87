// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "wifi_backend.h"

#include <cstdio>
#include <cstring>
#include <vector>

namespace wlanctl {

void print_help(const char* program_name) {
    printf("Usage: %s [options] <command>\n", program_name);
    printf("Commands:\n");
    printf("  scan                     List visible networks\n");
    printf("  connect <ssid> [pass]    Join a network (omit pass for open networks)\n");
    printf("  disconnect               Disconnect the interface\n");
    printf("  status                   Show the network the interface is using\n");
    printf("Options:\n");
    printf("  -i, --interface <name>   Wireless interface (default: config, wlan0)\n");
    printf("  -b, --backend <name>     Backend: auto, nmcli, netsh, mock\n");
    printf("  -c, --config <path>      Config file (default: ~/.config/wlanctl/config.json)\n");
    printf("  -j, --json               JSON output\n");
    printf("  -v, --verbose            Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>        Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>        Log file path (when --log-dest=file)\n");
    printf("  -h, --help               Show this help message\n");
    printf("  -V, --version            Show version information\n");
    printf("\nExit codes: 0 success, 1 action did not succeed, 2 error, 64 usage error\n");
}

const char* command_name(Command command) {
    switch (command) {
    case Command::NONE:
        return "none";
    case Command::SCAN:
        return "scan";
    case Command::CONNECT:
        return "connect";
    case Command::DISCONNECT:
        return "disconnect";
    case Command::STATUS:
        return "status";
    }
    return "none";
}

// Helper to fetch the value of an option that requires one
static bool take_value(int argc, const char* const* argv, int& i, std::string& out,
                       const char* name) {
    if (i + 1 >= argc) {
        fprintf(stderr, "Error: %s requires an argument\n", name);
        return false;
    }
    out = argv[++i];
    return true;
}

bool parse_cli_args(int argc, const char* const* argv, CliArgs& args) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return true;
        } else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            args.show_version = true;
            return true;
        } else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--interface") == 0) {
            if (!take_value(argc, argv, i, args.interface_name, "--interface"))
                return false;
        } else if (strcmp(arg, "-b") == 0 || strcmp(arg, "--backend") == 0) {
            if (!take_value(argc, argv, i, args.backend, "--backend"))
                return false;
            BackendKind kind;
            if (!parse_backend_kind(args.backend, kind)) {
                fprintf(stderr, "Error: unknown backend '%s' (auto, nmcli, netsh, mock)\n",
                        args.backend.c_str());
                return false;
            }
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (!take_value(argc, argv, i, args.config_path, "--config"))
                return false;
        } else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--json") == 0) {
            args.json_output = true;
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (!take_value(argc, argv, i, args.log_dest, "--log-dest"))
                return false;
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!take_value(argc, argv, i, args.log_file, "--log-file"))
                return false;
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            // -v, -vv, -vvv
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fprintf(stderr, "Error: unknown option '%s'\n", arg);
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        fprintf(stderr, "Error: no command given (scan, connect, disconnect, status)\n");
        return false;
    }

    const std::string& cmd = positional[0];
    size_t expected_min = 1;
    size_t expected_max = 1;

    if (cmd == "scan") {
        args.command = Command::SCAN;
    } else if (cmd == "disconnect") {
        args.command = Command::DISCONNECT;
    } else if (cmd == "status") {
        args.command = Command::STATUS;
    } else if (cmd == "connect") {
        args.command = Command::CONNECT;
        expected_min = 2;
        expected_max = 3;
    } else {
        fprintf(stderr, "Error: unknown command '%s'\n", cmd.c_str());
        return false;
    }

    if (positional.size() < expected_min || positional.size() > expected_max) {
        fprintf(stderr, "Error: wrong number of arguments for '%s'\n", cmd.c_str());
        return false;
    }

    if (args.command == Command::CONNECT) {
        args.ssid = positional[1];
        if (positional.size() > 2) {
            args.password = positional[2];
        }
    }

    return true;
}

} // namespace wlanctl
