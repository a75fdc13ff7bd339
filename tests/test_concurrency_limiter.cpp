#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <type_traits>
#include <vector>

#include "scheduler/concurrency_limiter.hpp"

using namespace std::chrono_literals;

TEST(ConcurrencyLimiterTest, ZeroCapacityRejected) {
    EXPECT_THROW(ConcurrencyLimiter::create(0), std::invalid_argument);
}

TEST(ConcurrencyLimiterTest, CreateIsTheOnlyWayIn) {
    static_assert(!std::is_constructible_v<ConcurrencyLimiter, std::size_t>);
    auto limiter = ConcurrencyLimiter::create(2);
    EXPECT_EQ(limiter.use_count(), 1);
    EXPECT_EQ(limiter->capacity(), 2u);
    {
        auto permit = limiter->tryAcquire();
        ASSERT_TRUE(permit.has_value());
        // 许可经 shared_from_this 共享所有权
        EXPECT_EQ(limiter.use_count(), 2);
    }
    EXPECT_EQ(limiter.use_count(), 1);
    EXPECT_EQ(limiter->inUse(), 0u);
}

TEST(ConcurrencyLimiterTest, PermitReleasedExactlyOnce) {
    auto limiter = ConcurrencyLimiter::create(1);
    CancelToken token;
    {
        auto permit = limiter->acquire(token);
        ASSERT_TRUE(permit.has_value());
        EXPECT_TRUE(permit->held());
        EXPECT_EQ(limiter->inUse(), 1u);
        EXPECT_FALSE(limiter->tryAcquire().has_value());

        permit->release();
        EXPECT_FALSE(permit->held());
        EXPECT_EQ(limiter->inUse(), 0u);
        permit->release();
        EXPECT_EQ(limiter->inUse(), 0u);
    }
    EXPECT_EQ(limiter->inUse(), 0u);
}

TEST(ConcurrencyLimiterTest, MovedPermitReleasesOnce) {
    auto limiter = ConcurrencyLimiter::create(2);
    {
        auto a = limiter->tryAcquire();
        ASSERT_TRUE(a.has_value());
        ConcurrencyLimiter::Permit b = std::move(*a);
        EXPECT_FALSE(a->held());
        EXPECT_TRUE(b.held());
        EXPECT_EQ(limiter->inUse(), 1u);
    }
    EXPECT_EQ(limiter->inUse(), 0u);
}

TEST(ConcurrencyLimiterTest, DefaultPermitIsUnbounded) {
    ConcurrencyLimiter::Permit permit;
    EXPECT_FALSE(permit.held());
    EXPECT_NO_THROW(permit.release());
}

TEST(ConcurrencyLimiterTest, AcquireGivesUpWhenCancelled) {
    auto limiter = ConcurrencyLimiter::create(1);
    auto held = limiter->tryAcquire();
    ASSERT_TRUE(held.has_value());

    CancelToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(30ms);
        token.requestCancel();
    });
    auto permit = limiter->acquire(token);
    canceller.join();
    EXPECT_FALSE(permit.has_value());
    EXPECT_EQ(limiter->inUse(), 1u);
}

TEST(ConcurrencyLimiterTest, NeverExceedsCapacity) {
    auto limiter = ConcurrencyLimiter::create(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            CancelToken token;
            auto permit = limiter->acquire(token);
            ASSERT_TRUE(permit.has_value());
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(5ms);
            --running;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(limiter->inUse(), 0u);
}

TEST(ConcurrencyLimiterTest, PermitOutlivesLimiterHandle) {
    std::optional<ConcurrencyLimiter::Permit> permit;
    {
        auto limiter = ConcurrencyLimiter::create(1);
        permit = limiter->tryAcquire();
        ASSERT_TRUE(permit.has_value());
    }
    // 许可持有旧限流器的所有权，句柄释放后仍可安全归还
    EXPECT_TRUE(permit->held());
    permit.reset();
}
