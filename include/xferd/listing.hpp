/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "xferd/context.hpp"

namespace xferd {

class Runner;
struct JobRun;

// One element of `lsjson` output.
struct ListEntry {
    std::string path;
    std::string name;
    std::int64_t size = 0;
    std::string modTime;
    bool isDir = false;
    bool isBucket = false;
    std::map<std::string, std::string> hashes;

    // Path, or Name when Path is blank.
    [[nodiscard]] std::string key() const;
};

struct Totals {
    std::int64_t objects = 0;
    std::int64_t bytes = 0;
};

// Parses a complete `lsjson` array. Throws JobError on malformed output.
[[nodiscard]] std::vector<ListEntry> decodeList(const std::string& text);

// Runs an `lsjson` style command to completion and decodes its output.
// `ctx` bounds the call (the job context when null).
[[nodiscard]] std::vector<ListEntry> runList(Runner& runner, JobRun& job, const std::vector<std::string>& args,
                                             const Context::Ptr& ctx = nullptr);

// Reads a descriptor until EOF.
[[nodiscard]] std::string readAll(int fd);

[[nodiscard]] std::string etagFromHashes(const std::map<std::string, std::string>& hashes);
// Normalized UTC timestamp, or empty when unparseable.
[[nodiscard]] std::string normalizeListTime(const std::string& value);
[[nodiscard]] std::string objectKey(const std::string& prefix, const std::string& name, bool preserveLeadingSlash);

// `*` and `?`; `*` also spans "/".
[[nodiscard]] bool wildcardMatch(const std::string& pattern, const std::string& value);
[[nodiscard]] bool shouldIncludePath(const std::string& path, const std::vector<std::string>& include,
                                     const std::vector<std::string>& exclude);

// Walks a local file or tree. Throws JobError on I/O errors, CanceledError
// when `ctx` ends.
[[nodiscard]] Totals computeLocalTotals(const Context::Ptr& ctx, const std::filesystem::path& root,
                                        const std::vector<std::string>& include,
                                        const std::vector<std::string>& exclude);

// Counts objects under a remote prefix. nullopt once more than `maxObjects`
// objects match.
[[nodiscard]] std::optional<Totals> computeRemoteTotals(Runner& runner, JobRun& job, const Context::Ptr& ctx,
                                                        const std::string& bucket, const std::string& prefix,
                                                        const std::vector<std::string>& include,
                                                        const std::vector<std::string>& exclude,
                                                        std::int64_t maxObjects = 50000);

} // namespace xferd
