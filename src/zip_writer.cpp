/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/zip_writer.hpp"
#include "xferd/errors.hpp"

#include <algorithm>

#include <zlib.h>

namespace xferd {

namespace {

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kDataDescriptorSig = 0x08074b50;
constexpr std::uint32_t kEndSig = 0x06054b50;
constexpr std::uint32_t kZip64EndSig = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;

constexpr std::uint16_t kVersion20 = 20;
constexpr std::uint16_t kVersion45 = 45;
constexpr std::uint16_t kCreatorUnix = 3 << 8;
// Data descriptor follows, names are UTF-8.
constexpr std::uint16_t kFlags = 0x0008 | 0x0800;
constexpr std::uint16_t kExtTimeTag = 0x5455;
constexpr std::uint16_t kZip64Tag = 0x0001;

void le16(std::string& b, std::uint16_t v) {
    b.push_back(static_cast<char>(v & 0xFF));
    b.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void le32(std::string& b, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void le64(std::string& b, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) b.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

std::string extTimeExtra(std::uint32_t mtime) {
    std::string b;
    le16(b, kExtTimeTag);
    le16(b, 5);
    b.push_back(1);
    le32(b, mtime);
    return b;
}

} // namespace

ZipWriter::ZipWriter(const std::filesystem::path& path) : path_(path) {
    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw JobError(ErrorCode::Unknown, "open " + path.string() + " for writing failed");
    }
}

void ZipWriter::put(const std::string& bytes) {
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        throw JobError(ErrorCode::Unknown, "write " + path_.string() + " failed");
    }
    offset_ += bytes.size();
}

void ZipWriter::beginEntry(const std::string& name, std::time_t modified, std::uint64_t expectedSize) {
    if (open_) {
        endEntry();
    }
    if (name.size() > kMax16) {
        throw JobError(ErrorCode::Unknown, "zip entry name too long");
    }

    Entry e;
    e.name = name;
    e.offset = offset_;
    e.mtime = static_cast<std::uint32_t>(modified);
    std::tm tm{};
    gmtime_r(&modified, &tm);
    if (tm.tm_year < 80) {
        tm = std::tm{};
        tm.tm_year = 80;
        tm.tm_mday = 1;
    }
    e.dosTime = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    e.dosDate = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    e.crc = static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0));
    e.zip64Local = expectedSize >= kMax32;

    // Sizes live in the data descriptor; the zip64 field only marks its format.
    std::string extra;
    if (e.zip64Local) {
        le16(extra, kZip64Tag);
        le16(extra, 16);
        le64(extra, 0);
        le64(extra, 0);
    }
    extra += extTimeExtra(e.mtime);

    std::string h;
    le32(h, kLocalHeaderSig);
    le16(h, e.zip64Local ? kVersion45 : kVersion20);
    le16(h, kFlags);
    le16(h, 0);  // stored
    le16(h, e.dosTime);
    le16(h, e.dosDate);
    le32(h, 0);
    le32(h, e.zip64Local ? kMax32 : 0);
    le32(h, e.zip64Local ? kMax32 : 0);
    le16(h, static_cast<std::uint16_t>(name.size()));
    le16(h, static_cast<std::uint16_t>(extra.size()));
    h += name;
    h += extra;
    put(h);

    entries_.push_back(std::move(e));
    open_ = true;
}

void ZipWriter::write(const char* data, std::size_t size) {
    if (!open_) {
        throw JobError(ErrorCode::Unknown, "zip write without an open entry");
    }
    auto& e = entries_.back();
    if (!e.zip64Local && e.size + size >= kMax32) {
        throw JobError(ErrorCode::Unknown, "zip entry " + e.name + " outgrew its expected size");
    }
    std::size_t done = 0;
    while (done < size) {
        auto chunk = static_cast<uInt>(std::min<std::size_t>(size - done, 1u << 30));
        e.crc = static_cast<std::uint32_t>(
            crc32(e.crc, reinterpret_cast<const Bytef*>(data + done), chunk));
        done += chunk;
    }
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw JobError(ErrorCode::Unknown, "write " + path_.string() + " failed");
    }
    offset_ += size;
    e.size += size;
}

void ZipWriter::endEntry() {
    if (!open_) {
        return;
    }
    open_ = false;
    const auto& e = entries_.back();
    std::string d;
    le32(d, kDataDescriptorSig);
    le32(d, e.crc);
    if (e.zip64Local) {
        le64(d, e.size);
        le64(d, e.size);
    } else {
        le32(d, static_cast<std::uint32_t>(e.size));
        le32(d, static_cast<std::uint32_t>(e.size));
    }
    put(d);
}

void ZipWriter::finish() {
    if (finished_) {
        return;
    }
    endEntry();

    const std::uint64_t dirStart = offset_;
    for (const auto& e : entries_) {
        const bool z64 = e.zip64();
        std::string extra;
        if (z64) {
            le16(extra, kZip64Tag);
            le16(extra, 24);
            le64(extra, e.size);
            le64(extra, e.size);
            le64(extra, e.offset);
        }
        extra += extTimeExtra(e.mtime);

        std::string h;
        le32(h, kCentralHeaderSig);
        le16(h, kCreatorUnix | (z64 ? kVersion45 : kVersion20));
        le16(h, z64 ? kVersion45 : kVersion20);
        le16(h, kFlags);
        le16(h, 0);
        le16(h, e.dosTime);
        le16(h, e.dosDate);
        le32(h, e.crc);
        le32(h, z64 ? kMax32 : static_cast<std::uint32_t>(e.size));
        le32(h, z64 ? kMax32 : static_cast<std::uint32_t>(e.size));
        le16(h, static_cast<std::uint16_t>(e.name.size()));
        le16(h, static_cast<std::uint16_t>(extra.size()));
        le16(h, 0);  // comment
        le16(h, 0);  // disk
        le16(h, 0);  // internal attributes
        le32(h, 0100644u << 16);
        le32(h, z64 ? kMax32 : static_cast<std::uint32_t>(e.offset));
        h += e.name;
        h += extra;
        put(h);
    }
    const std::uint64_t dirEnd = offset_;
    const std::uint64_t dirSize = dirEnd - dirStart;
    const std::uint64_t count = entries_.size();

    std::string tail;
    if (count >= kMax16 || dirSize >= kMax32 || dirStart >= kMax32) {
        le32(tail, kZip64EndSig);
        le64(tail, 44);
        le16(tail, kCreatorUnix | kVersion45);
        le16(tail, kVersion45);
        le32(tail, 0);
        le32(tail, 0);
        le64(tail, count);
        le64(tail, count);
        le64(tail, dirSize);
        le64(tail, dirStart);

        le32(tail, kZip64LocatorSig);
        le32(tail, 0);
        le64(tail, dirEnd);
        le32(tail, 1);
    }
    auto count16 = static_cast<std::uint16_t>(count >= kMax16 ? kMax16 : count);
    le32(tail, kEndSig);
    le16(tail, 0);
    le16(tail, 0);
    le16(tail, count16);
    le16(tail, count16);
    le32(tail, dirSize >= kMax32 ? kMax32 : static_cast<std::uint32_t>(dirSize));
    le32(tail, dirStart >= kMax32 ? kMax32 : static_cast<std::uint32_t>(dirStart));
    le16(tail, 0);
    put(tail);

    out_.flush();
    out_.close();
    if (out_.fail()) {
        throw JobError(ErrorCode::Unknown, "close " + path_.string() + " failed");
    }
    finished_ = true;
}

} // namespace xferd
