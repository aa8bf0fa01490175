/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "xferd/types.hpp"

namespace xferd {

inline constexpr const char* kRemoteName = "remote";

// INI section for the transfer tool describing the profile's S3 endpoint.
[[nodiscard]] std::string renderRemoteConfig(const ProfileSecrets& profile);
// Writes the rendered config with mode 0600. Throws JobError on I/O failure.
void writeRemoteConfig(const std::filesystem::path& path, const ProfileSecrets& profile);

// Trims and drops a leading "/" unless the profile keeps it.
[[nodiscard]] std::string normalizePathInput(const std::string& value, bool preserveLeadingSlash);
// normalizePathInput plus a trailing "/" when non-empty.
[[nodiscard]] std::string normalizePrefix(const std::string& prefix, bool preserveLeadingSlash);

[[nodiscard]] std::string remoteBucket(const std::string& bucket);
[[nodiscard]] std::string remoteDir(const std::string& bucket, const std::string& prefix, bool preserveLeadingSlash);
[[nodiscard]] std::string remoteObject(const std::string& bucket, const std::string& key, bool preserveLeadingSlash);

// TLS flags for one invocation. Client material is written to a private
// temp dir that lives as long as this object.
class TlsMaterial {
public:
    // Throws JobError(invalid_config) on bad TLS settings.
    explicit TlsMaterial(const ProfileSecrets& profile);
    ~TlsMaterial();

    TlsMaterial(const TlsMaterial&) = delete;
    TlsMaterial& operator=(const TlsMaterial&) = delete;

    [[nodiscard]] const std::vector<std::string>& flags() const noexcept { return flags_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    void cleanup() noexcept;

private:
    std::vector<std::string> flags_;
    std::filesystem::path dir_;
};

} // namespace xferd
