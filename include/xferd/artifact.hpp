/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "xferd/types.hpp"

namespace xferd {

class Runner;
class ZipWriter;
struct JobRun;

// One remote object destined for a zip artifact.
struct ZipObject {
    std::string key;
    std::string entryName;
    std::int64_t size = 0;
    std::optional<std::time_t> lastModified;
};

// Cleaned, relative entry name. Throws std::invalid_argument naming the
// problem ("empty", "null", "invalid", "traversal", "invalid segment").
[[nodiscard]] std::string sanitizeZipEntryName(const std::string& name);

// Returns `name`, or "base-N.ext" for the first free N in [2, 9999].
[[nodiscard]] std::string uniqueZipEntryName(std::set<std::string>& used, const std::string& name);

[[nodiscard]] std::string safeZipFilename(const std::string& value);
[[nodiscard]] std::string defaultZipNameFromPrefix(const std::string& bucket, const std::string& prefix);
[[nodiscard]] std::string defaultZipNameFromKeys(const std::string& bucket, const std::string& stripPrefix,
                                                 const std::vector<ZipObject>& objects);

// Builds <artifactDir>/<jobId>.zip by streaming each object's contents
// from the transfer tool into a stored zip entry.
class ArtifactBuilder {
public:
    ArtifactBuilder(Runner& runner, JobRun& job);

    ArtifactBuilder(const ArtifactBuilder&) = delete;
    ArtifactBuilder& operator=(const ArtifactBuilder&) = delete;

    // Writes to a temp file and renames on success. Any failure removes both
    // the temp and final paths and rethrows.
    void build(const std::string& artifactName, const std::string& bucket, const std::vector<ZipObject>& objects);

    [[nodiscard]] std::filesystem::path finalPath() const;
    [[nodiscard]] std::filesystem::path tempPath() const;

    static constexpr std::chrono::milliseconds kPublishInterval{800};
    static constexpr std::size_t kCopyBufferSize = 256 * 1024;

private:
    void writeObjects(ZipWriter& zip, const std::string& bucket, const std::vector<ZipObject>& objects);
    void writeObject(ZipWriter& zip, const std::string& bucket, const ZipObject& object);
    void publish(bool force);
    void removeOutputs() noexcept;

    Runner& runner_;
    JobRun& job_;
    std::set<std::string> usedNames_;
    std::vector<char> buffer_;

    std::int64_t objectsDone_ = 0;
    std::int64_t objectsTotal_ = 0;
    std::int64_t bytesDone_ = 0;
    std::int64_t bytesTotal_ = 0;
    std::chrono::steady_clock::time_point startedAt_;
    std::optional<std::chrono::steady_clock::time_point> lastPublish_;
};

} // namespace xferd
