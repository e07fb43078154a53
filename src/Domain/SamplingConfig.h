#pragma once

#include <algorithm>

namespace Domain::Sampling
{

// Refresh cadence (milliseconds)
inline constexpr int REFRESH_INTERVAL_DEFAULT_MS = 1000;
inline constexpr int REFRESH_INTERVAL_MIN_MS = 100;
inline constexpr int REFRESH_INTERVAL_MAX_MS = 5000;

// inode -> process cache lifetime (milliseconds); 0 rebuilds on every lookup
inline constexpr int PROCESS_CACHE_DEFAULT_MS = 5000;
inline constexpr int PROCESS_CACHE_MIN_MS = 0;
inline constexpr int PROCESS_CACHE_MAX_MS = 60000;

// Reverse lookup worker pool
inline constexpr int RESOLVER_WORKERS_DEFAULT = 4;
inline constexpr int RESOLVER_WORKERS_MIN = 1;
inline constexpr int RESOLVER_WORKERS_MAX = 32;

inline constexpr int RESOLVER_TIMEOUT_DEFAULT_MS = 5000;
inline constexpr int RESOLVER_TIMEOUT_MIN_MS = 500;
inline constexpr int RESOLVER_TIMEOUT_MAX_MS = 30000;

inline constexpr int RESOLVER_QUEUE_DEFAULT = 256;
inline constexpr int RESOLVER_QUEUE_MIN = 1;
inline constexpr int RESOLVER_QUEUE_MAX = 4096;

// Circuit breaker around a refresh
inline constexpr int BREAKER_THRESHOLD_DEFAULT = 5;
inline constexpr int BREAKER_THRESHOLD_MIN = 1;
inline constexpr int BREAKER_THRESHOLD_MAX = 100;

inline constexpr int BREAKER_TIMEOUT_DEFAULT_S = 30;
inline constexpr int BREAKER_TIMEOUT_MIN_S = 1;
inline constexpr int BREAKER_TIMEOUT_MAX_S = 3600;

template<typename T> [[nodiscard]] constexpr T clampRefreshInterval(T value)
{
    return std::clamp(value, static_cast<T>(REFRESH_INTERVAL_MIN_MS), static_cast<T>(REFRESH_INTERVAL_MAX_MS));
}

template<typename T> [[nodiscard]] constexpr T clampProcessCacheInterval(T value)
{
    return std::clamp(value, static_cast<T>(PROCESS_CACHE_MIN_MS), static_cast<T>(PROCESS_CACHE_MAX_MS));
}

template<typename T> [[nodiscard]] constexpr T clampResolverWorkers(T value)
{
    return std::clamp(value, static_cast<T>(RESOLVER_WORKERS_MIN), static_cast<T>(RESOLVER_WORKERS_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampResolverTimeout(T value)
{
    return std::clamp(value, static_cast<T>(RESOLVER_TIMEOUT_MIN_MS), static_cast<T>(RESOLVER_TIMEOUT_MAX_MS));
}

template<typename T> [[nodiscard]] constexpr T clampResolverQueue(T value)
{
    return std::clamp(value, static_cast<T>(RESOLVER_QUEUE_MIN), static_cast<T>(RESOLVER_QUEUE_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampBreakerThreshold(T value)
{
    return std::clamp(value, static_cast<T>(BREAKER_THRESHOLD_MIN), static_cast<T>(BREAKER_THRESHOLD_MAX));
}

template<typename T> [[nodiscard]] constexpr T clampBreakerTimeout(T value)
{
    return std::clamp(value, static_cast<T>(BREAKER_TIMEOUT_MIN_S), static_cast<T>(BREAKER_TIMEOUT_MAX_S));
}

} // namespace Domain::Sampling
