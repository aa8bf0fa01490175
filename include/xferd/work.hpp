/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "xferd/config.hpp"
#include "xferd/types.hpp"

namespace xferd {

class FileStore;

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidType,
    InvalidPayload,
    ProfileNotFound,
    JobNotFound,
    NotCancelable
};

struct SubmitResult {
    bool ok = false;
    std::string id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Client side of the daemon: writes jobs, profiles and upload sessions into
// the shared store and drops cancel markers the daemon picks up.
class Work final {
public:
    explicit Work(const Config& config);
    ~Work();

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    [[nodiscard]] bool ready() const noexcept { return ready_; }

    // Validates the type and payload, then persists the job as queued.
    [[nodiscard]] SubmitResult submit(const std::string& profileId, const std::string& type,
                                      const Json::Value& payload);

    // Queued or running jobs only. The daemon applies the marker on its next scan.
    [[nodiscard]] SubmitResult cancel(const JobId& jobId);

    [[nodiscard]] std::optional<Job> status(const JobId& jobId);
    [[nodiscard]] std::vector<Job> list(std::size_t limit);

    [[nodiscard]] SubmitResult putProfile(const Json::Value& profile);

    // New session with a fresh staging directory; the id doubles as uploadId.
    [[nodiscard]] SubmitResult createUploadSession(const std::string& profileId, const std::string& bucket,
                                                   const std::string& prefix);
    [[nodiscard]] std::optional<UploadSession> uploadSession(const std::string& profileId,
                                                             const std::string& uploadId);

    [[nodiscard]] std::filesystem::path logPath(const JobId& jobId) const;
    [[nodiscard]] std::filesystem::path artifactPath(const JobId& jobId) const;

    [[nodiscard]] static std::string generateId();

private:
    [[nodiscard]] bool writeCancelMarker(const JobId& jobId) const noexcept;

    Config config_;
    std::unique_ptr<FileStore> store_;
    bool ready_ = false;
};

} // namespace xferd
