// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/crypto/KdfWorkerPool.h"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace AuthKeep;
using namespace std::chrono_literals;

TEST(KdfWorkerPoolTest, RunsTaskAndReturnsResult) {
    KdfWorkerPool pool({2, 8, 5000ms});
    auto result = pool.run<int>([]() -> AuthResult<int> { return 42; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(KdfWorkerPoolTest, PropagatesTaskError) {
    KdfWorkerPool pool({1, 8, 5000ms});
    auto result = pool.run<int>([]() -> AuthResult<int> {
        return std::unexpected(AuthError::DecryptionFailed);
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AuthError::DecryptionFailed);
}

TEST(KdfWorkerPoolTest, ThrowingTaskBecomesInternalError) {
    KdfWorkerPool pool({1, 8, 5000ms});
    auto result = pool.run<int>([]() -> AuthResult<int> {
        throw std::runtime_error("boom");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AuthError::InternalError);

    // The worker survives
    EXPECT_EQ(*pool.run<int>([]() -> AuthResult<int> { return 1; }), 1);
}

TEST(KdfWorkerPoolTest, SlowTaskTimesOut) {
    KdfWorkerPool pool({1, 8, 50ms});
    auto result = pool.run<int>([]() -> AuthResult<int> {
        std::this_thread::sleep_for(300ms);
        return 1;
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AuthError::ConfigurationError);
}

TEST(KdfWorkerPoolTest, FullQueueIsRejected) {
    std::atomic<bool> release{false};
    KdfWorkerPool pool({1, 1, 20ms});
    auto blocker = [&release]() -> AuthResult<int> {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return 0;
    };

    // First task occupies the worker, second fills the queue; both time out
    EXPECT_FALSE(pool.run<int>(blocker).has_value());
    EXPECT_FALSE(pool.run<int>(blocker).has_value());
    EXPECT_EQ(pool.pending(), 1u);

    auto rejected = pool.run<int>([]() -> AuthResult<int> { return 1; });
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), AuthError::InternalError);

    release = true;
}

TEST(KdfWorkerPoolTest, ManyConcurrentCallers) {
    KdfWorkerPool pool({4, 256, 5000ms});
    std::atomic<int> total{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 8; ++t) {
        callers.emplace_back([&pool, &total, t] {
            for (int i = 0; i < 20; ++i) {
                auto value = pool.run<int>([t]() -> AuthResult<int> { return t; });
                if (value) {
                    total += *value;
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(total.load(), 20 * (0 + 1 + 2 + 3 + 4 + 5 + 6 + 7));
    EXPECT_EQ(pool.pending(), 0u);
}
