/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <filesystem>

#include <sys/stat.h>

#include "test_support.hpp"
#include "xferd/errors.hpp"
#include "xferd/remote.hpp"

using namespace xferd;

TEST(Remote, PathHelpers) {
    EXPECT_EQ(remoteBucket(" b "), "remote:b");
    EXPECT_EQ(remoteDir("b", "", false), "remote:b");
    EXPECT_EQ(remoteDir("b", "/logs", false), "remote:b/logs/");
    EXPECT_EQ(remoteDir("b", "/logs/", true), "remote:b//logs/");
    EXPECT_EQ(remoteObject("b", "/a/k.txt", false), "remote:b/a/k.txt");
    EXPECT_EQ(remoteObject("b", "/a/k.txt", true), "remote:b//a/k.txt");
    EXPECT_EQ(normalizePrefix("  x ", false), "x/");
    EXPECT_EQ(normalizePrefix("", false), "");
}

TEST(Remote, RendersS3Section) {
    auto profile = test::testProfile();
    profile.sessionToken = " tok ";
    auto text = renderRemoteConfig(profile);
    EXPECT_NE(text.find("[remote]\n"), std::string::npos);
    EXPECT_NE(text.find("type = s3\n"), std::string::npos);
    EXPECT_NE(text.find("provider = Other\n"), std::string::npos);
    EXPECT_NE(text.find("endpoint = http://127.0.0.1:9000\n"), std::string::npos);
    EXPECT_NE(text.find("session_token = tok\n"), std::string::npos);
    EXPECT_NE(text.find("force_path_style = true\n"), std::string::npos);

    profile.provider = ProfileProvider::AwsS3;
    profile.endpoint.clear();
    text = renderRemoteConfig(profile);
    EXPECT_NE(text.find("provider = AWS\n"), std::string::npos);
    EXPECT_EQ(text.find("endpoint"), std::string::npos);
}

TEST(Remote, ConfigFileIsPrivate) {
    test::TempDir dir;
    auto path = dir.path() / "logs" / "job.rclone.conf";
    writeRemoteConfig(path, test::testProfile());
    struct stat st {};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(Remote, TlsMaterialLifecycle) {
    auto profile = test::testProfile();
    profile.tlsInsecureSkipVerify = true;
    profile.tls = ProfileTls{TlsMode::Mtls, "CERT", "KEY", "CA"};

    std::filesystem::path dir;
    {
        TlsMaterial tls(profile);
        dir = tls.directory();
        const auto& flags = tls.flags();
        ASSERT_EQ(flags.size(), 7u);
        EXPECT_EQ(flags[0], "--no-check-certificate");
        EXPECT_EQ(flags[1], "--client-cert");
        EXPECT_EQ(flags[5], "--ca-cert");
        EXPECT_EQ(test::readText(flags[4]), "KEY");
        EXPECT_TRUE(std::filesystem::exists(dir));
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST(Remote, MtlsWithoutKeyIsInvalidConfig) {
    auto profile = test::testProfile();
    profile.tls = ProfileTls{TlsMode::Mtls, "CERT", "  ", ""};
    try {
        TlsMaterial tls(profile);
        FAIL() << "expected JobError";
    } catch (const JobError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
    }
}
