#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace Platform
{

enum class DecodeErrorKind : std::uint8_t
{
    InvalidHex,
    InvalidDecimal,
    InvalidAddress,
    InvalidPid,
    TooFewFields,
};

/// Failure to decode a value from a kernel socket table line.
struct DecodeError
{
    DecodeErrorKind kind = DecodeErrorKind::InvalidHex;
    std::string message;
};

/// Failure to read a pseudo-file or directory under the proc root.
struct ProcReadError
{
    std::filesystem::path path;
    std::error_code code;

    [[nodiscard]] std::string message() const
    {
        return path.string() + ": " + code.message();
    }
};

} // namespace Platform
