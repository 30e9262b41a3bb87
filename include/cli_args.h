// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for wlanctl
 */

#include <string>

namespace wlanctl {

/**
 * @brief Action requested on the command line
 */
enum class Command { NONE, SCAN, CONNECT, DISCONNECT, STATUS };

/**
 * @brief Parsed command-line arguments
 *
 * Empty strings mean "not given on the command line, use config".
 */
struct CliArgs {
    Command command = Command::NONE;

    // connect <ssid> [password]
    std::string ssid;
    std::string password;

    // Backend selection
    std::string interface_name; // -i, --interface
    std::string backend;        // -b, --backend

    std::string config_path; // -c, --config

    // Output
    bool json_output = false; // -j, --json

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest
    std::string log_file; // --log-file

    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success (including --help/--version), false on usage error
 */
bool parse_cli_args(int argc, const char* const* argv, CliArgs& args);

void print_help(const char* program_name);

const char* command_name(Command command);

} // namespace wlanctl
