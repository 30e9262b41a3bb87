// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace wlanctl {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux) or console
    Journal, ///< systemd journal (requires WLANCTL_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console;
    std::string file_path;      ///< Override for LogTarget::File (empty = auto)
    bool enable_console = true; ///< Colored stderr sink
};

/**
 * @brief Install the default "wlanctl" logger
 */
void init(const LogConfig& config);

/**
 * @brief Parse "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
 *
 * Case sensitive. Returns default_level for anything else.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity beats config, config beats default (warn)
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace wlanctl
