#pragma once

#include "MonitorError.h"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Domain
{

enum class CircuitState : std::uint8_t
{
    Closed,   // Normal operation
    Open,     // Rejecting calls until the timeout has elapsed
    HalfOpen, // Trial call after the timeout
};

[[nodiscard]] std::string_view toString(CircuitState state) noexcept;

inline constexpr std::uint32_t DEFAULT_FAILURE_THRESHOLD = 5;
inline constexpr std::chrono::milliseconds DEFAULT_BREAKER_TIMEOUT{std::chrono::seconds(30)};

template<typename R> struct IsMonitorExpected : std::false_type
{
};

template<typename T> struct IsMonitorExpected<std::expected<T, MonitorError>> : std::true_type
{
};

/// Operations a breaker (or the retry helpers) can wrap: callables returning std::expected<T, MonitorError>.
template<typename Op>
concept MonitorOperation = std::invocable<Op&> && IsMonitorExpected<std::invoke_result_t<Op&>>::value;

/// Failure-isolation state machine.
///
/// Closed -> Open once failureCount() reaches the threshold.
/// Open -> HalfOpen only when more than timeout() has passed since the last failure;
/// until then call() rejects with ErrorKind::CircuitOpen without invoking the operation.
/// Any success returns to Closed and resets the count.
///
/// Thread-safe. The lock is not held while the wrapped operation runs.
class CircuitBreaker
{
  public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit CircuitBreaker(std::uint32_t failureThreshold = DEFAULT_FAILURE_THRESHOLD,
                            std::chrono::milliseconds timeout = DEFAULT_BREAKER_TIMEOUT,
                            TimeSource timeSource = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;
    ~CircuitBreaker() = default;

    template<MonitorOperation Op> auto call(Op&& op) -> std::invoke_result_t<Op&>
    {
        if (auto admitted = admit(); !admitted)
        {
            return std::unexpected(std::move(admitted.error()));
        }

        auto result = op();
        if (result)
        {
            recordSuccess();
        }
        else
        {
            recordFailure();
        }
        return result;
    }

    /// Decide whether a call may proceed now, moving Open -> HalfOpen when the timeout has passed.
    [[nodiscard]] std::expected<void, MonitorError> admit();
    void recordSuccess();
    void recordFailure();

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] std::uint32_t failureCount() const;

    [[nodiscard]] std::uint32_t failureThreshold() const noexcept
    {
        return m_FailureThreshold;
    }

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept
    {
        return m_Timeout;
    }

  private:
    [[nodiscard]] Clock::time_point now() const;

    const std::uint32_t m_FailureThreshold;
    const std::chrono::milliseconds m_Timeout;
    TimeSource m_TimeSource;

    mutable std::mutex m_Mutex;
    CircuitState m_State = CircuitState::Closed;
    std::uint32_t m_FailureCount = 0;
    std::optional<Clock::time_point> m_LastFailure;
};

} // namespace Domain
