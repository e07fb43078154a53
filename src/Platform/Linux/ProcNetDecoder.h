#pragma once

#include "Platform/ProcErrors.h"

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

/// Decoders for the textual socket tables under <proc>/net/{tcp,tcp6,udp,udp6}.
///
/// A table line looks like:
///   sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode
///   0: 0100007F:0277 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 23871 ...
///
/// Addresses are "<ip hex>:<port hex>". IPv4 hex is the kernel's native-endian 32-bit word, so on
/// little-endian hosts "0100007F" is 127.0.0.1.
namespace Platform::ProcNet
{

using Ipv4Bytes = std::array<std::uint8_t, 4>;
using Ipv6Bytes = std::array<std::uint8_t, 16>;

/// Minimum number of whitespace-separated fields in a usable table line.
inline constexpr std::size_t MIN_SOCKET_LINE_FIELDS = 10;

/// Fields extracted from one socket table line.
struct SocketLine
{
    std::string local;
    std::string remote;
    std::string state;
    std::uint64_t inode = 0; // 0 when absent or unparsable
};

[[nodiscard]] std::expected<std::uint8_t, DecodeError> parseHexU8(std::string_view hex);

[[nodiscard]] std::expected<std::uint16_t, DecodeError> decodePortHex(std::string_view hex);

/// Decode 8 hex digits of either case; byte i of the address comes from hex pair (3 - i).
[[nodiscard]] std::expected<Ipv4Bytes, DecodeError> decodeIpv4Hex(std::string_view hex);

/// Inverse of decodeIpv4Hex in the kernel's upper-case form, so lower-case input
/// round-trips to its upper-case spelling.
[[nodiscard]] std::string encodeIpv4Hex(const Ipv4Bytes& address);

/// Decode 32 hex digits; byte i of the address comes from hex pair i.
[[nodiscard]] std::expected<Ipv6Bytes, DecodeError> decodeIpv6Hex(std::string_view hex);

[[nodiscard]] std::string formatIpv4(const Ipv4Bytes& address);

/// RFC 5952 text form, without brackets.
[[nodiscard]] std::string formatIpv6(const Ipv6Bytes& address);

/// Split "<ip>:<port>" into its two parts; anything but exactly one ':' is invalid.
[[nodiscard]] std::expected<std::pair<std::string_view, std::string_view>, DecodeError> splitSocketAddress(std::string_view field);

/// Render a table address as "a.b.c.d:port" or "[v6]:port".
[[nodiscard]] std::expected<std::string, DecodeError> decodeSocketAddress(std::string_view field);

/// Map the state byte to its name; "UNKNOWN(<n>)" for unlisted values, "UNKNOWN" when not hex.
[[nodiscard]] std::string decodeTcpState(std::string_view hex);

[[nodiscard]] std::expected<std::uint64_t, DecodeError> parseInode(std::string_view decimal);

/// Digits-only pid string to number.
[[nodiscard]] std::expected<std::int32_t, DecodeError> validatePid(std::string_view pid);

/// Parse one data line (not the header).
[[nodiscard]] std::expected<SocketLine, DecodeError> parseSocketLine(std::string_view line);

} // namespace Platform::ProcNet
