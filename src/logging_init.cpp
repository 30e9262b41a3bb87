// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef WLANCTL_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace wlanctl {
namespace logging {

namespace {

/// Get XDG_STATE_HOME or default ~/.local/state
std::string get_xdg_state_home() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string user_dir = get_xdg_state_home() + "/wlanctl";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/wlanctl.log";
}

/// Detect best available logging target at runtime
LogTarget detect_best_target() {
#ifdef __linux__
#ifdef WLANCTL_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Add system sink based on target
void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
#ifdef WLANCTL_HAS_SYSTEMD
    case LogTarget::Journal:
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>("wlanctl"));
        break;
#endif
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("wlanctl", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
#ifdef __linux__
    default:
        // Journal requested without systemd support
        if (target == LogTarget::Journal) {
            sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>("wlanctl", LOG_PID,
                                                                            LOG_USER, false));
        }
        break;
#else
    default:
        break;
#endif
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries command output (scan tables, JSON), so the console sink is stderr
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    try {
        add_system_sink(sinks, effective_target, config.file_path);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "[Logging] Could not open %s sink: %s\n", log_target_name(effective_target),
                e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("wlanctl", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace wlanctl
