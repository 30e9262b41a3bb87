// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace wlanctl {

/**
 * @brief Captured result of running an external command
 *
 * `spawned == false` means the program never ran (pipe/fork/exec failure);
 * `error` then carries the reason. A non-zero exit code is NOT a spawn
 * failure: network tools report many outcomes through stdout alone.
 */
struct ProcessOutput {
    bool spawned = false;    ///< True if the program was started and reaped
    int exit_code = -1;      ///< Exit status, -1 if killed by a signal
    std::string stdout_text; ///< Captured stdout, lossy UTF-8 decoded
    std::string error;       ///< Spawn failure detail (empty when spawned)
};

/**
 * @brief Capability to run a named program with arguments
 *
 * Backends never build shell command lines. Arguments go to the program
 * verbatim, so SSIDs and passwords cannot be interpreted by a shell.
 * Tests inject a fake that returns canned text.
 */
class ProcessExecutor {
  public:
    virtual ~ProcessExecutor() = default;

    /**
     * @brief Run program and block until it exits
     *
     * @param program Program name (PATH lookup) or path
     * @param args Arguments, excluding argv[0]
     * @return Captured output and status
     */
    virtual ProcessOutput run(const std::string& program, const std::vector<std::string>& args) = 0;
};

/**
 * @brief fork/execvp executor capturing stdout through a pipe
 *
 * stderr is redirected to /dev/null. No timeout: a hung tool blocks the caller.
 */
class PosixProcessExecutor : public ProcessExecutor {
  public:
    ProcessOutput run(const std::string& program, const std::vector<std::string>& args) override;
};

/**
 * @brief Render program + args for log messages ("nmcli d wifi list")
 *
 * The caller is responsible for not passing secrets.
 */
std::string format_command(const std::string& program, const std::vector<std::string>& args);

} // namespace wlanctl
