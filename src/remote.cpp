/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/remote.hpp"
#include "xferd/errors.hpp"
#include "xferd/logger.hpp"
#include "xferd/util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <unistd.h>

namespace xferd {

namespace fs = std::filesystem;

namespace {

void writePrivateFile(const fs::path& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw JobError(ErrorCode::Unknown, "open " + path.string() + ": " + std::strerror(errno));
    }
    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            int e = errno;
            ::close(fd);
            throw JobError(ErrorCode::Unknown, "write " + path.string() + ": " + std::strerror(e));
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        throw JobError(ErrorCode::Unknown, "close " + path.string() + ": " + std::strerror(errno));
    }
}

} // namespace

std::string renderRemoteConfig(const ProfileSecrets& profile) {
    std::ostringstream out;
    out << "[" << kRemoteName << "]\n";
    out << "type = s3\n";
    out << "provider = " << (profile.provider == ProfileProvider::AwsS3 ? "AWS" : "Other") << "\n";

    auto endpoint = trim(profile.endpoint);
    if (!endpoint.empty()) {
        out << "endpoint = " << endpoint << "\n";
    }
    auto region = trim(profile.region);
    if (!region.empty()) {
        out << "region = " << region << "\n";
    }
    out << "access_key_id = " << profile.accessKeyId << "\n";
    out << "secret_access_key = " << profile.secretAccessKey << "\n";
    if (profile.sessionToken) {
        auto token = trim(*profile.sessionToken);
        if (!token.empty()) {
            out << "session_token = " << token << "\n";
        }
    }
    out << "force_path_style = " << (profile.forcePathStyle ? "true" : "false") << "\n";
    return out.str();
}

void writeRemoteConfig(const fs::path& path, const ProfileSecrets& profile) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw JobError(ErrorCode::Unknown, "create " + path.parent_path().string() + ": " + ec.message());
    }
    try {
        writePrivateFile(path, renderRemoteConfig(profile));
    } catch (...) {
        fs::remove(path, ec);
        throw;
    }
}

std::string normalizePathInput(const std::string& value, bool preserveLeadingSlash) {
    auto v = trim(value);
    if (!preserveLeadingSlash && startsWith(v, "/")) {
        v.erase(0, 1);
    }
    return v;
}

std::string normalizePrefix(const std::string& prefix, bool preserveLeadingSlash) {
    auto p = normalizePathInput(prefix, preserveLeadingSlash);
    if (!p.empty() && !endsWith(p, "/")) {
        p += "/";
    }
    return p;
}

std::string remoteBucket(const std::string& bucket) {
    return std::string(kRemoteName) + ":" + trim(bucket);
}

std::string remoteDir(const std::string& bucket, const std::string& prefix, bool preserveLeadingSlash) {
    auto p = normalizePrefix(prefix, preserveLeadingSlash);
    if (p.empty()) {
        return remoteBucket(bucket);
    }
    return remoteBucket(bucket) + "/" + p;
}

std::string remoteObject(const std::string& bucket, const std::string& key, bool preserveLeadingSlash) {
    auto k = normalizePathInput(key, preserveLeadingSlash);
    if (k.empty()) {
        return remoteBucket(bucket);
    }
    return remoteBucket(bucket) + "/" + k;
}

TlsMaterial::TlsMaterial(const ProfileSecrets& profile) {
    if (profile.tlsInsecureSkipVerify) {
        flags_.emplace_back("--no-check-certificate");
    }
    if (!profile.tls || profile.tls->mode == TlsMode::Disabled) {
        return;
    }

    auto cert = trim(profile.tls->clientCertPem);
    auto key = trim(profile.tls->clientKeyPem);
    if (cert.empty() || key.empty()) {
        throw JobError(ErrorCode::InvalidConfig, "mtls requires client certificate and key");
    }

    std::string tmpl = (fs::temp_directory_path() / "rclone-tls-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        throw JobError(ErrorCode::Unknown, std::string("create tls dir: ") + std::strerror(errno));
    }
    dir_ = tmpl;

    try {
        auto certPath = dir_ / "client-cert.pem";
        writePrivateFile(certPath, cert);
        auto keyPath = dir_ / "client-key.pem";
        writePrivateFile(keyPath, key);
        flags_.insert(flags_.end(), {"--client-cert", certPath.string(), "--client-key", keyPath.string()});

        auto ca = trim(profile.tls->caCertPem);
        if (!ca.empty()) {
            auto caPath = dir_ / "ca.pem";
            writePrivateFile(caPath, ca);
            flags_.insert(flags_.end(), {"--ca-cert", caPath.string()});
        }
    } catch (...) {
        cleanup();
        throw;
    }
}

TlsMaterial::~TlsMaterial() {
    cleanup();
}

void TlsMaterial::cleanup() noexcept {
    if (dir_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        LOG_WARN("Failed to remove tls dir " + dir_.string() + ": " + ec.message());
    }
    dir_.clear();
}

} // namespace xferd
