/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace xferd {

struct Semver {
    int major = 0;
    int minor = 0;
    int patch = 0;

    [[nodiscard]] int compare(const Semver& other) const noexcept;
};

struct EngineInfo {
    std::string path;
    std::string version;
};

// First "[v]X.Y[.Z]" found anywhere in `text`.
[[nodiscard]] std::optional<Semver> parseSemver(const std::string& text);
[[nodiscard]] bool isEngineVersionCompatible(const std::string& versionLine);

// Explicit path (must exist), then local fallbacks, then PATH.
// Throws EngineError(transfer_engine_missing).
[[nodiscard]] std::string resolveEnginePath(const std::string& explicitPath);

// First line of `<path> version`; nullopt on failure or timeout.
[[nodiscard]] std::optional<std::string> detectEngineVersion(const std::string& path,
                                                             std::chrono::milliseconds timeout);

// Resolves and version-checks the transfer tool, caching the result per path.
class EngineLocator {
public:
    explicit EngineLocator(std::string explicitPath) : explicitPath_(std::move(explicitPath)) {}

    EngineLocator(const EngineLocator&) = delete;
    EngineLocator& operator=(const EngineLocator&) = delete;

    // Throws EngineError with transfer_engine_missing or transfer_engine_incompatible.
    [[nodiscard]] EngineInfo ensureCompatible();

    static constexpr const char* kMinVersion = "1.52.0";
    static constexpr std::chrono::milliseconds kVersionTimeout{2000};

private:
    std::string explicitPath_;
    std::mutex mutex_;
    std::map<std::string, std::string> versions_;
};

[[nodiscard]] std::string incompatibleMessage(const std::string& version, const std::string& reason);

} // namespace xferd
