/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace xferd {

// Streaming zip writer for stored (uncompressed) entries. Sizes and CRCs
// follow each entry in a data descriptor; zip64 records are added when a
// size, offset or entry count passes the 32-bit limits.
//
// Every method throws JobError on I/O failure.
class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& path);
    ~ZipWriter() = default;

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // `expectedSize` decides the entry's record format: at or past the
    // 32-bit limit the local header carries a zip64 extra field and the
    // data descriptor uses 64-bit sizes. A smaller entry that grows past
    // the limit makes write() throw.
    void beginEntry(const std::string& name, std::time_t modified, std::uint64_t expectedSize = 0);
    void write(const char* data, std::size_t size);
    void endEntry();
    // Writes the central directory. No entry may be open.
    void finish();

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return offset_; }
    [[nodiscard]] std::size_t entryCount() const noexcept { return entries_.size(); }

    static constexpr std::uint32_t kMax32 = 0xFFFFFFFFu;
    static constexpr std::uint16_t kMax16 = 0xFFFFu;

private:
    struct Entry {
        std::string name;
        std::uint16_t dosTime = 0;
        std::uint16_t dosDate = 0;
        std::uint32_t mtime = 0;
        std::uint32_t crc = 0;
        std::uint64_t size = 0;
        std::uint64_t offset = 0;
        bool zip64Local = false;
        [[nodiscard]] bool zip64() const noexcept { return zip64Local || size >= kMax32 || offset >= kMax32; }
    };

    void put(const std::string& bytes);

    std::filesystem::path path_;
    std::ofstream out_;
    std::vector<Entry> entries_;
    bool open_ = false;
    bool finished_ = false;
    std::uint64_t offset_ = 0;
};

} // namespace xferd
