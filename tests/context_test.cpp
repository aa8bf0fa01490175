/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "xferd/context.hpp"
#include "xferd/errors.hpp"

using namespace xferd;

TEST(Context, ChildFollowsParentCancel) {
    auto parent = Context::withCancel(Context::background());
    auto child = Context::withCancel(parent);
    EXPECT_FALSE(child->done());

    parent->cancel();
    EXPECT_TRUE(child->canceled());
    EXPECT_EQ(child->error(), ContextError::Canceled);
    EXPECT_THROW(child->check(), CanceledError);
}

TEST(Context, CancelingChildLeavesParent) {
    auto parent = Context::withCancel(Context::background());
    auto child = Context::withCancel(parent);
    child->cancel();
    EXPECT_TRUE(child->done());
    EXPECT_FALSE(parent->done());
}

TEST(Context, DeadlineReportsExceeded) {
    auto ctx = Context::withTimeout(Context::background(), std::chrono::milliseconds(20));
    EXPECT_FALSE(ctx->sleepFor(std::chrono::seconds(5)));
    EXPECT_EQ(ctx->error(), ContextError::DeadlineExceeded);
    EXPECT_FALSE(ctx->canceled());
    try {
        ctx->check();
        FAIL() << "expected CanceledError";
    } catch (const CanceledError& e) {
        EXPECT_STREQ(e.what(), "context deadline exceeded");
        EXPECT_EQ(e.code(), ErrorCode::Canceled);
    }
}

TEST(Context, ChildInheritsEarlierDeadline) {
    auto parent = Context::withTimeout(Context::background(), std::chrono::milliseconds(50));
    auto child = Context::withTimeout(parent, std::chrono::seconds(60));
    ASSERT_TRUE(child->deadline().has_value());
    EXPECT_EQ(*child->deadline(), *parent->deadline());
}

TEST(Context, SleepWakesOnCancel) {
    auto ctx = Context::withCancel(Context::background());
    std::thread canceler([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ctx->cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx->sleepFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceler.join();
}

TEST(Context, OnCancelRunsOnceAndImmediatelyWhenDone) {
    auto ctx = Context::withCancel(Context::background());
    std::atomic<int> calls{0};
    (void)ctx->onCancel([&] { ++calls; });
    ctx->cancel();
    ctx->cancel();
    EXPECT_EQ(calls.load(), 1);

    (void)ctx->onCancel([&] { ++calls; });
    EXPECT_EQ(calls.load(), 2);
}

TEST(Context, WaitUntilDoneReturnsOnPredicate) {
    auto ctx = Context::withCancel(Context::background());
    std::atomic<bool> ready{false};
    std::thread setter([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ready = true;
        ctx->wake();
    });
    EXPECT_FALSE(ctx->waitUntilDone([&] { return ready.load(); }));
    setter.join();
}
