/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/process.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace xferd {

namespace {

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe");
        }
    }
    ~Pipe() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }
    int release(int end) noexcept {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }
};

const char* signalName(int sig) {
    switch (sig) {
        case SIGKILL: return "killed";
        case SIGTERM: return "terminated";
        case SIGINT:  return "interrupt";
        case SIGSEGV: return "segmentation fault";
        case SIGPIPE: return "broken pipe";
        case SIGABRT: return "aborted";
        default: return nullptr;
    }
}

} // namespace

std::string ExitStatus::describe() const {
    if (exited) {
        return "exit status " + std::to_string(code);
    }
    if (signal != 0) {
        const char* name = signalName(signal);
        return std::string("signal: ") + (name ? name : std::to_string(signal));
    }
    return "process did not exit cleanly";
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::string& program,
                                                  const std::vector<std::string>& args) {
    // Everything the child touches is prepared before fork.
    std::vector<std::string> argvStore;
    argvStore.reserve(args.size() + 1);
    argvStore.push_back(program);
    argvStore.insert(argvStore.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argvStore.size() + 1);
    for (auto& a : argvStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    Pipe out;
    Pipe err;
    Pipe exec;
    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull < 0) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        closeFd(devNull);
        throw std::system_error(e, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (::dup2(devNull, STDIN_FILENO) < 0 ||
            ::dup2(out.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(err.fds[1], STDERR_FILENO) < 0) {
            int e = errno;
            (void)!::write(exec.fds[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execv(argv[0], argv.data());
        int e = errno;
        (void)!::write(exec.fds[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Also set from the parent so a kill right after spawn hits the group.
    ::setpgid(pid, pid);
    closeFd(devNull);
    closeFd(exec.fds[1]);

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->stdout_ = out.release(0);
    child->stderr_ = err.release(0);
    closeFd(out.fds[1]);
    closeFd(err.fds[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(exec.fds[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        child->wait();
        throw std::system_error(childErr, std::generic_category(), "exec " + program);
    }
    return child;
}

ChildProcess::~ChildProcess() {
    if (!reaped_.load() && pid_ > 0) {
        killGroup();
        wait();
    }
    closeOutputs();
}

void ChildProcess::closeOutputs() noexcept {
    closeFd(stdout_);
    closeFd(stderr_);
}

void ChildProcess::killGroup() noexcept {
    if (pid_ > 0 && !reaped_.load()) {
        ::kill(-pid_, SIGKILL);
    }
}

ExitStatus ChildProcess::wait() noexcept {
    if (reaped_.load() || pid_ <= 0) {
        return status_;
    }
    int raw = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &raw, 0);
    } while (r < 0 && errno == EINTR);
    reaped_.store(true);
    if (r < 0) {
        LOG_WARN("waitpid failed for pid " + std::to_string(pid_) + ": " + std::strerror(errno));
        return status_;
    }
    if (WIFEXITED(raw)) {
        status_.exited = true;
        status_.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status_.signal = WTERMSIG(raw);
    }
    return status_;
}

std::string lookPath(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    const char* path = std::getenv("PATH");
    if (!path) {
        return {};
    }
    for (const auto& dir : split(path, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

} // namespace xferd
