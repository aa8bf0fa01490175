/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace xferd {

struct ExitStatus {
    bool exited = false;
    int code = -1;
    int signal = 0;

    [[nodiscard]] bool success() const noexcept { return exited && code == 0; }
    // "exit status 1", "signal: killed"
    [[nodiscard]] std::string describe() const;
};

// Child process in its own process group with piped stdout and stderr.
// Destroying a child that was never waited kills its group and reaps it.
class ChildProcess {
public:
    // Throws std::system_error when the pipes cannot be created, the fork
    // fails or the program cannot be executed.
    [[nodiscard]] static std::unique_ptr<ChildProcess> spawn(const std::string& program,
                                                             const std::vector<std::string>& args);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdoutFd() const noexcept { return stdout_; }
    [[nodiscard]] int stderrFd() const noexcept { return stderr_; }

    void closeOutputs() noexcept;

    // SIGKILL to the whole process group; safe to call from any thread.
    void killGroup() noexcept;

    // Reaps the child. Later calls return the cached status.
    ExitStatus wait() noexcept;

private:
    ChildProcess() = default;

    pid_t pid_ = -1;
    int stdout_ = -1;
    int stderr_ = -1;
    std::atomic<bool> reaped_{false};
    ExitStatus status_;
};

// Resolves `name` against PATH; empty when not found.
[[nodiscard]] std::string lookPath(const std::string& name);

} // namespace xferd
