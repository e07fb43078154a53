#pragma once

#include "Platform/IReverseLookup.h"
#include "Platform/ProcErrors.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace Domain
{

enum class ErrorKind : std::uint8_t
{
    ProcIo,
    Parse,
    InvalidAddress,
    InvalidPid,
    Resolution,
    CircuitOpen,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

/// Uniform error reported by the refresh pipeline and the resilience helpers.
/// Component errors are converted into this only where they are reported together.
struct MonitorError
{
    ErrorKind kind = ErrorKind::ProcIo;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] std::string describe() const;

    bool operator==(const MonitorError&) const = default;
};

[[nodiscard]] MonitorError toMonitorError(const Platform::ProcReadError& error);
[[nodiscard]] MonitorError toMonitorError(const Platform::DecodeError& error);
[[nodiscard]] MonitorError toMonitorError(const Platform::LookupError& error);

} // namespace Domain
