// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_executor.h"

#include "utils/text_utils.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wlanctl {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessOutput spawn_failure(const std::string& program, const std::string& what, int err) {
    ProcessOutput out;
    out.spawned = false;
    out.error = what + " failed for '" + program + "': " + strerror(err);
    spdlog::debug("[Process] {}", out.error);
    return out;
}

} // namespace

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string cmd = program;
    for (const auto& arg : args) {
        cmd += ' ';
        cmd += arg;
    }
    return cmd;
}

ProcessOutput PosixProcessExecutor::run(const std::string& program,
                                        const std::vector<std::string>& args) {
    // stdout pipe, plus a close-on-exec pipe the child uses to report exec errno.
    // EOF on the status pipe without data means exec succeeded.
    int out_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe(out_pipe) < 0) {
        return spawn_failure(program, "pipe()", errno);
    }
    if (pipe(status_pipe) < 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return spawn_failure(program, "pipe()", err);
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return spawn_failure(program, "fork()", err);
    }

    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null, then exec without a shell
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(status_pipe[0]);

        execvp(program.c_str(), argv.data());

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(status_pipe[1]);

    std::string raw;
    std::array<char, 512> buffer;
    for (;;) {
        ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            raw.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::warn("[Process] read() from '{}' failed: {}", program, strerror(errno));
            break;
        }
    }
    close_fd(out_pipe[0]);

    int exec_errno = 0;
    ssize_t status_read;
    do {
        status_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    int status = 0;
    pid_t wait_result;
    do {
        wait_result = waitpid(pid, &status, 0);
    } while (wait_result < 0 && errno == EINTR);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        return spawn_failure(program, "execvp()", exec_errno);
    }
    if (wait_result < 0) {
        return spawn_failure(program, "waitpid()", errno);
    }

    ProcessOutput out;
    out.spawned = true;
    out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    out.stdout_text = utf8_lossy(raw);

    if (out.exit_code != 0) {
        spdlog::trace("[Process] '{}' exited with code {}", program, out.exit_code);
    }
    return out;
}

} // namespace wlanctl
