/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/engine.hpp"
#include "xferd/errors.hpp"
#include "xferd/logger.hpp"
#include "xferd/process.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <poll.h>
#include <regex>
#include <sys/stat.h>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> findLocalEngine() {
    std::vector<fs::path> candidates;
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto exeDir = exe.parent_path();
        candidates.push_back(exeDir / "rclone");
        candidates.push_back(exeDir / "bin" / "rclone");
    }
    candidates.emplace_back(fs::path(".tools") / "bin" / "rclone");
    candidates.emplace_back(fs::path("..") / ".tools" / "bin" / "rclone");
    candidates.emplace_back(fs::path("dist") / "bin" / "rclone");
    candidates.emplace_back(fs::path("..") / "dist" / "bin" / "rclone");

    for (const auto& p : candidates) {
        std::error_code sec;
        auto st = fs::status(p, sec);
        if (sec || !fs::exists(st) || fs::is_directory(st)) {
            continue;
        }
        return p.string();
    }
    return std::nullopt;
}

} // namespace

int Semver::compare(const Semver& other) const noexcept {
    if (major != other.major) return major < other.major ? -1 : 1;
    if (minor != other.minor) return minor < other.minor ? -1 : 1;
    if (patch != other.patch) return patch < other.patch ? -1 : 1;
    return 0;
}

std::optional<Semver> parseSemver(const std::string& text) {
    static const std::regex re(R"(\b[vV]?(\d+)\.(\d+)(?:\.(\d+))?)");
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return std::nullopt;
    }
    try {
        Semver v;
        v.major = std::stoi(m[1].str());
        v.minor = std::stoi(m[2].str());
        if (m[3].matched) {
            v.patch = std::stoi(m[3].str());
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool isEngineVersionCompatible(const std::string& versionLine) {
    auto cur = parseSemver(versionLine);
    auto min = parseSemver(EngineLocator::kMinVersion);
    if (!cur || !min) {
        return false;
    }
    return cur->compare(*min) >= 0;
}

std::string incompatibleMessage(const std::string& version, const std::string& reason) {
    std::string cur = trim(version);
    std::string why = trim(reason);
    std::string out = cur.empty() ? "rclone is incompatible" : "rclone " + cur + " is incompatible";
    out += std::string(" (requires >= ") + EngineLocator::kMinVersion + ")";
    if (!why.empty()) {
        out += ": " + why;
    }
    return out;
}

std::string resolveEnginePath(const std::string& explicitPath) {
    if (explicitPath.empty()) {
        if (auto local = findLocalEngine()) {
            return *local;
        }
        auto found = lookPath("rclone");
        if (found.empty()) {
            throw EngineError(ErrorCode::TransferEngineMissing,
                              "rclone not found in PATH (or set RCLONE_PATH)");
        }
        return found;
    }

    struct stat st{};
    if (::stat(explicitPath.c_str(), &st) != 0) {
        throw EngineError(ErrorCode::TransferEngineMissing,
                          "invalid RCLONE_PATH \"" + explicitPath + "\": " + std::strerror(errno));
    }
    return explicitPath;
}

std::optional<std::string> detectEngineVersion(const std::string& path, std::chrono::milliseconds timeout) {
    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(path, {"version"});
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to run " + path + " version: " + std::string(e.what()));
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string out;
    char buf[4096];
    bool timedOut = false;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd{child->stdoutFd(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) {
            timedOut = rc == 0;
            break;
        }
        ssize_t n = ::read(child->stdoutFd(), buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    if (timedOut) {
        child->killGroup();
    }
    auto status = child->wait();
    if (timedOut || !status.success()) {
        return std::nullopt;
    }

    auto lines = split(trim(out), '\n');
    if (lines.empty()) {
        return std::nullopt;
    }
    auto first = trim(lines.front());
    if (first.empty()) {
        return std::nullopt;
    }
    return first;
}

EngineInfo EngineLocator::ensureCompatible() {
    EngineInfo info;
    info.path = resolveEnginePath(explicitPath_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = versions_.find(info.path);
        if (it != versions_.end()) {
            info.version = it->second;
            return info;
        }
    }

    auto version = detectEngineVersion(info.path, kVersionTimeout);
    if (!version) {
        throw EngineError(ErrorCode::TransferEngineIncompatible,
                          incompatibleMessage("", "unable to determine rclone version"));
    }
    if (!isEngineVersionCompatible(*version)) {
        throw EngineError(ErrorCode::TransferEngineIncompatible,
                          incompatibleMessage(*version, "version too old"));
    }

    info.version = *version;
    std::lock_guard<std::mutex> lock(mutex_);
    versions_[info.path] = info.version;
    LOG_INFO("Using transfer tool " + info.path + " (" + info.version + ")");
    return info;
}

} // namespace xferd
