// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/SamplingConfig.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace Domain::Sampling
{
namespace
{

// ========== Constants Tests ==========

TEST(SamplingConfigTest, DefaultsAreValid)
{
    EXPECT_GE(REFRESH_INTERVAL_DEFAULT_MS, REFRESH_INTERVAL_MIN_MS);
    EXPECT_LE(REFRESH_INTERVAL_DEFAULT_MS, REFRESH_INTERVAL_MAX_MS);

    EXPECT_GE(PROCESS_CACHE_DEFAULT_MS, PROCESS_CACHE_MIN_MS);
    EXPECT_LE(PROCESS_CACHE_DEFAULT_MS, PROCESS_CACHE_MAX_MS);

    EXPECT_GE(RESOLVER_WORKERS_DEFAULT, RESOLVER_WORKERS_MIN);
    EXPECT_LE(RESOLVER_WORKERS_DEFAULT, RESOLVER_WORKERS_MAX);

    EXPECT_GE(RESOLVER_TIMEOUT_DEFAULT_MS, RESOLVER_TIMEOUT_MIN_MS);
    EXPECT_LE(RESOLVER_TIMEOUT_DEFAULT_MS, RESOLVER_TIMEOUT_MAX_MS);

    EXPECT_GE(RESOLVER_QUEUE_DEFAULT, RESOLVER_QUEUE_MIN);
    EXPECT_LE(RESOLVER_QUEUE_DEFAULT, RESOLVER_QUEUE_MAX);

    EXPECT_GE(BREAKER_THRESHOLD_DEFAULT, BREAKER_THRESHOLD_MIN);
    EXPECT_LE(BREAKER_THRESHOLD_DEFAULT, BREAKER_THRESHOLD_MAX);

    EXPECT_GE(BREAKER_TIMEOUT_DEFAULT_S, BREAKER_TIMEOUT_MIN_S);
    EXPECT_LE(BREAKER_TIMEOUT_DEFAULT_S, BREAKER_TIMEOUT_MAX_S);
}

TEST(SamplingConfigTest, ProcessCacheAndBreakerDefaults)
{
    EXPECT_EQ(PROCESS_CACHE_DEFAULT_MS, 5000);
    EXPECT_EQ(BREAKER_THRESHOLD_DEFAULT, 5);
    EXPECT_EQ(BREAKER_TIMEOUT_DEFAULT_S, 30);
}

// ========== clampRefreshInterval Tests ==========

TEST(SamplingConfigTest, ClampRefreshIntervalInRange)
{
    EXPECT_EQ(clampRefreshInterval(500), 500);
    EXPECT_EQ(clampRefreshInterval(REFRESH_INTERVAL_MIN_MS), REFRESH_INTERVAL_MIN_MS);
    EXPECT_EQ(clampRefreshInterval(REFRESH_INTERVAL_MAX_MS), REFRESH_INTERVAL_MAX_MS);
}

TEST(SamplingConfigTest, ClampRefreshIntervalOutOfRange)
{
    EXPECT_EQ(clampRefreshInterval(0), REFRESH_INTERVAL_MIN_MS);
    EXPECT_EQ(clampRefreshInterval(-100), REFRESH_INTERVAL_MIN_MS);
    EXPECT_EQ(clampRefreshInterval(100000), REFRESH_INTERVAL_MAX_MS);
}

TEST(SamplingConfigTest, ClampRefreshIntervalWithDifferentTypes)
{
    EXPECT_EQ(clampRefreshInterval(std::int64_t{50}), std::int64_t{REFRESH_INTERVAL_MIN_MS});
    EXPECT_EQ(clampRefreshInterval(std::uint32_t{2000}), std::uint32_t{2000});
}

// ========== Other clamps ==========

TEST(SamplingConfigTest, ProcessCacheAllowsZero)
{
    EXPECT_EQ(clampProcessCacheInterval(0), 0);
    EXPECT_EQ(clampProcessCacheInterval(-1), 0);
    EXPECT_EQ(clampProcessCacheInterval(10'000'000), PROCESS_CACHE_MAX_MS);
}

TEST(SamplingConfigTest, ResolverClamps)
{
    EXPECT_EQ(clampResolverWorkers(0), RESOLVER_WORKERS_MIN);
    EXPECT_EQ(clampResolverWorkers(1000), RESOLVER_WORKERS_MAX);
    EXPECT_EQ(clampResolverTimeout(1), RESOLVER_TIMEOUT_MIN_MS);
    EXPECT_EQ(clampResolverTimeout(2500), 2500);
    EXPECT_EQ(clampResolverQueue(0), RESOLVER_QUEUE_MIN);
    EXPECT_EQ(clampResolverQueue(1'000'000), RESOLVER_QUEUE_MAX);
}

TEST(SamplingConfigTest, BreakerClamps)
{
    EXPECT_EQ(clampBreakerThreshold(0), BREAKER_THRESHOLD_MIN);
    EXPECT_EQ(clampBreakerThreshold(7), 7);
    EXPECT_EQ(clampBreakerTimeout(0), BREAKER_TIMEOUT_MIN_S);
    EXPECT_EQ(clampBreakerTimeout(999999), BREAKER_TIMEOUT_MAX_S);
}

TEST(SamplingConfigTest, ClampsAreConstexpr)
{
    static_assert(clampRefreshInterval(1) == REFRESH_INTERVAL_MIN_MS);
    static_assert(clampBreakerThreshold(5) == 5);
    SUCCEED();
}

} // namespace
} // namespace Domain::Sampling
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
