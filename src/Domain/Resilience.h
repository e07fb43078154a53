#pragma once

#include "CircuitBreaker.h"
#include "MonitorError.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <ranges>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Composable failure handling around std::expected<T, MonitorError> operations.
namespace Domain::Resilience
{

inline constexpr double DEFAULT_BACKOFF_MULTIPLIER = 1.5;

struct RetryPolicy
{
    std::uint32_t maxRetries = 3;
    std::chrono::milliseconds initialDelay{100};
    double multiplier = DEFAULT_BACKOFF_MULTIPLIER;
};

/// Backoff delays keep their fraction so small delays still grow by the multiplier.
using BackoffDelay = std::chrono::duration<double, std::milli>;

/// Sleeps between attempts; tests pass a recorder instead of really sleeping.
using Sleeper = std::function<void(BackoffDelay)>;

/// Invoke @p op up to maxRetries + 1 times, sleeping initialDelay, then initialDelay * multiplier, ...
/// between attempts. The last failure is returned as-is.
template<MonitorOperation Op> auto retryWithBackoff(Op&& op, const RetryPolicy& policy = {}, const Sleeper& sleeper = {}) -> std::invoke_result_t<Op&>
{
    BackoffDelay delay = policy.initialDelay;

    for (std::uint32_t attempt = 0;; ++attempt)
    {
        auto result = op();
        if (result || attempt >= policy.maxRetries)
        {
            return result;
        }

        spdlog::debug("Attempt {} failed: {}, retrying in {}ms", attempt + 1, result.error().describe(), delay.count());
        if (sleeper)
        {
            sleeper(delay);
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::nanoseconds>(delay));
        }

        delay *= policy.multiplier;
    }
}

/// Result of @p primary, or of @p fallback (which cannot fail) when primary fails.
template<MonitorOperation Primary, std::invocable Fallback>
auto gracefulDegradation(Primary&& primary, Fallback&& fallback) -> typename std::invoke_result_t<Primary&>::value_type
{
    auto result = primary();
    if (result)
    {
        return std::move(*result);
    }

    spdlog::debug("Operation failed, using degraded result: {}", result.error().describe());
    return fallback();
}

/// First successful result of @p operations, tried in order; the last error when all fail.
template<typename T> auto tryOperations(const std::vector<std::function<std::expected<T, MonitorError>()>>& operations) -> std::expected<T, MonitorError>
{
    std::expected<T, MonitorError> last =
        std::unexpected(MonitorError{.kind = ErrorKind::Parse, .message = "All operations failed"});

    for (const auto& operation : operations)
    {
        last = operation();
        if (last)
        {
            return last;
        }
        spdlog::debug("Operation failed: {}", last.error().describe());
    }
    return last;
}

template<MonitorOperation Op> auto withCircuitBreaker(CircuitBreaker& breaker, Op&& op) -> std::invoke_result_t<Op&>
{
    return breaker.call(std::forward<Op>(op));
}

template<typename R> using BatchValue = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

template<typename Item, typename Value> struct BatchSuccess
{
    Item item;
    Value value;
};

template<typename Item> struct BatchFailure
{
    Item item;
    MonitorError error;
};

template<typename Item, typename Value> struct BatchResult
{
    std::vector<BatchSuccess<Item, Value>> succeeded;
    std::vector<BatchFailure<Item>> failed;

    [[nodiscard]] bool allFailed() const noexcept
    {
        return succeeded.empty() && !failed.empty();
    }
};

/// Apply @p op to every item; a failure never stops the batch.
template<std::ranges::input_range Items, typename Op,
         typename Item = std::ranges::range_value_t<Items>,
         typename R = std::invoke_result_t<Op&, const Item&>>
    requires IsMonitorExpected<R>::value
auto batchWithPartialFailure(const Items& items, Op&& op) -> BatchResult<Item, BatchValue<typename R::value_type>>
{
    using Value = typename R::value_type;
    BatchResult<Item, BatchValue<Value>> batch;

    for (const auto& item : items)
    {
        auto result = op(item);
        if (!result)
        {
            spdlog::debug("Batch item failed: {}", result.error().describe());
            batch.failed.push_back(BatchFailure<Item>{.item = item, .error = std::move(result.error())});
            continue;
        }

        if constexpr (std::is_void_v<Value>)
        {
            batch.succeeded.push_back(BatchSuccess<Item, BatchValue<Value>>{.item = item, .value = {}});
        }
        else
        {
            batch.succeeded.push_back(BatchSuccess<Item, BatchValue<Value>>{.item = item, .value = std::move(*result)});
        }
    }

    return batch;
}

/// Whole file contents, or @p fallback when it cannot be read.
[[nodiscard]] std::string readFileWithFallback(const std::filesystem::path& path, std::string_view fallback);

/// @p parser applied to @p line, or @p fallback on any parse error.
template<typename Parser, typename T>
    requires std::invocable<Parser&, std::string_view>
[[nodiscard]] auto parseWithFallback(std::string_view line, Parser&& parser, T fallback) -> T
{
    auto parsed = parser(line);
    if (!parsed)
    {
        return fallback;
    }
    return static_cast<T>(std::move(*parsed));
}

} // namespace Domain::Resilience
