#pragma once

#include "Platform/ConnectionTypes.h"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace UI::Format
{

inline constexpr double BYTES_PER_KIB = 1024.0;

/// Throughput with one decimal: "512.0B/s", "1.5KB/s", ... "2.0TB/s".
[[nodiscard]] inline auto formatBytesPerSecond(std::uint64_t bytesPerSecond) -> std::string
{
    constexpr std::array<std::string_view, 4> units = {"B", "KB", "MB", "GB"};

    auto value = static_cast<double>(bytesPerSecond);
    for (const auto unit : units)
    {
        if (value < BYTES_PER_KIB)
        {
            return fmt::format("{:.1f}{}/s", value, unit);
        }
        value /= BYTES_PER_KIB;
    }
    return fmt::format("{:.1f}TB/s", value);
}

/// Running total: "B" and "KB" with one decimal, everything larger in MB with two.
[[nodiscard]] inline auto formatBytesTotal(std::uint64_t bytes) -> std::string
{
    const auto value = static_cast<double>(bytes);
    if (value < BYTES_PER_KIB)
    {
        return fmt::format("{:.1f} B", value);
    }
    if (value < BYTES_PER_KIB * BYTES_PER_KIB)
    {
        return fmt::format("{:.1f} KB", value / BYTES_PER_KIB);
    }
    return fmt::format("{:.2f} MB", value / (BYTES_PER_KIB * BYTES_PER_KIB));
}

/// "name(pid)" when the pid is known, otherwise just the name.
[[nodiscard]] inline auto processDisplay(const Platform::Connection& connection) -> std::string
{
    if (connection.pid == Platform::NOT_AVAILABLE)
    {
        return connection.program;
    }
    return connection.program + "(" + connection.pid + ")";
}

[[nodiscard]] inline auto isActive(const Platform::Connection& connection) noexcept -> bool
{
    return connection.rxRate > 0 || connection.txRate > 0;
}

} // namespace UI::Format
