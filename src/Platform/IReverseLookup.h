#pragma once

#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>

namespace Platform
{

enum class LookupErrorKind : std::uint8_t
{
    InvalidAddress,
    CommandUnavailable,
    SpawnFailed,
    NoRecord,
    TimedOut,
    Cancelled,
};

struct LookupError
{
    LookupErrorKind kind = LookupErrorKind::NoRecord;
    std::string message;
};

/// Backend that turns a bare IP address into a hostname.
/// Implementations may block; callers run them off the sampling thread.
class IReverseLookup
{
  public:
    virtual ~IReverseLookup() = default;

    IReverseLookup() = default;
    IReverseLookup(const IReverseLookup&) = default;
    IReverseLookup& operator=(const IReverseLookup&) = default;
    IReverseLookup(IReverseLookup&&) = default;
    IReverseLookup& operator=(IReverseLookup&&) = default;

    /// Resolve @p ip (no brackets, no port). Should return promptly with Cancelled once
    /// @p stopToken is signalled.
    [[nodiscard]] virtual std::expected<std::string, LookupError> reverseLookup(const std::string& ip, std::stop_token stopToken) = 0;
};

} // namespace Platform
