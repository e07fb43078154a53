#include "CircuitBreaker.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace Domain
{

std::string_view toString(CircuitState state) noexcept
{
    switch (state)
    {
    case CircuitState::Closed:
        return "closed";
    case CircuitState::Open:
        return "open";
    case CircuitState::HalfOpen:
        return "half-open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::uint32_t failureThreshold, std::chrono::milliseconds timeout, TimeSource timeSource)
    : m_FailureThreshold(std::max<std::uint32_t>(1, failureThreshold)), m_Timeout(timeout), m_TimeSource(std::move(timeSource))
{
}

CircuitBreaker::Clock::time_point CircuitBreaker::now() const
{
    return m_TimeSource ? m_TimeSource() : Clock::now();
}

std::expected<void, MonitorError> CircuitBreaker::admit()
{
    const auto currentTime = now();

    std::lock_guard lock(m_Mutex);
    if (m_State != CircuitState::Open)
    {
        return {};
    }

    if (m_LastFailure && (currentTime - *m_LastFailure) > m_Timeout)
    {
        m_State = CircuitState::HalfOpen;
        spdlog::debug("Circuit breaker half-open, allowing a trial call");
        return {};
    }

    return std::unexpected(MonitorError{.kind = ErrorKind::CircuitOpen, .message = "Circuit breaker is open"});
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard lock(m_Mutex);
    if (m_State != CircuitState::Closed)
    {
        spdlog::info("Circuit breaker closed after successful call");
    }
    m_State = CircuitState::Closed;
    m_FailureCount = 0;
    m_LastFailure.reset();
}

void CircuitBreaker::recordFailure()
{
    const auto currentTime = now();

    std::lock_guard lock(m_Mutex);
    if (m_FailureCount < std::numeric_limits<std::uint32_t>::max())
    {
        ++m_FailureCount;
    }
    m_LastFailure = currentTime;

    if (m_FailureCount >= m_FailureThreshold)
    {
        if (m_State != CircuitState::Open)
        {
            spdlog::warn("Circuit breaker opened after {} consecutive failures", m_FailureCount);
        }
        m_State = CircuitState::Open;
    }
}

CircuitState CircuitBreaker::state() const
{
    std::lock_guard lock(m_Mutex);
    return m_State;
}

bool CircuitBreaker::isOpen() const
{
    std::lock_guard lock(m_Mutex);
    return m_State == CircuitState::Open;
}

std::uint32_t CircuitBreaker::failureCount() const
{
    std::lock_guard lock(m_Mutex);
    return m_FailureCount;
}

} // namespace Domain
