#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <limits>
#include <utility>

namespace Domain::Numeric
{

template<typename T>
    requires(std::integral<T> || std::floating_point<T>)
[[nodiscard]] constexpr auto toDouble(T value) noexcept -> double
{
    return static_cast<double>(value);
}

/// Safe narrowing conversion with fallback value.
/// Returns fallback if value is out of range for target type.
template<std::integral To, std::integral From> [[nodiscard]] constexpr auto narrowOr(From value, To fallback) noexcept -> To
{
    if (!std::in_range<To>(value))
    {
        return fallback;
    }
    return static_cast<To>(value);
}

/// current - previous, or 0 when the counter went backwards (pid reuse, counter reset).
template<std::unsigned_integral T> [[nodiscard]] constexpr auto saturatingSub(T current, T previous) noexcept -> T
{
    return current > previous ? current - previous : T{0};
}

/// Convert a byte delta over @p seconds to whole bytes/sec (truncated), clamped to the uint64 range.
[[nodiscard]] inline auto bytesPerSecond(std::uint64_t delta, double seconds) noexcept -> std::uint64_t
{
    if (delta == 0 || !(seconds > 0.0))
    {
        return 0;
    }

    const double rate = toDouble(delta) / seconds;
    if (rate >= toDouble(std::numeric_limits<std::uint64_t>::max()))
    {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(rate);
}

} // namespace Domain::Numeric
