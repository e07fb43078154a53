#include "ProcNetDecoder.h"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace Platform::ProcNet
{

namespace
{

constexpr std::size_t IPV4_HEX_LENGTH = 8;
constexpr std::size_t IPV6_HEX_LENGTH = 32;

constexpr std::array<std::string_view, 12> TCP_STATE_NAMES = {
    "ESTABLISHED", // 0x01
    "SYN_SENT",    // 0x02
    "SYN_RECV",    // 0x03
    "FIN_WAIT1",   // 0x04
    "FIN_WAIT2",   // 0x05
    "TIME_WAIT",   // 0x06
    "CLOSE",       // 0x07
    "CLOSE_WAIT",  // 0x08
    "LAST_ACK",    // 0x09
    "LISTEN",      // 0x0A
    "CLOSING",     // 0x0B
    "NEW_SYN_RECV" // 0x0C
};

[[nodiscard]] DecodeError makeError(DecodeErrorKind kind, std::string_view what, std::string_view input)
{
    std::string message(what);
    message += " '";
    message += input;
    message += "'";
    return DecodeError{.kind = kind, .message = std::move(message)};
}

/// Parse the whole of @p text as an unsigned integer in @p base.
template<typename T> [[nodiscard]] bool parseWhole(std::string_view text, T& value, int base)
{
    if (text.empty())
    {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

[[nodiscard]] std::vector<std::string_view> splitWhitespace(std::string_view line)
{
    std::vector<std::string_view> fields;
    fields.reserve(17); // Typical tcp line width

    std::size_t pos = 0;
    while (pos < line.size())
    {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r' || line[pos] == '\n'))
        {
            ++pos;
        }
        if (pos >= line.size())
        {
            break;
        }
        const std::size_t start = pos;
        while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '\r' && line[pos] != '\n')
        {
            ++pos;
        }
        fields.push_back(line.substr(start, pos - start));
    }
    return fields;
}

} // namespace

std::expected<std::uint8_t, DecodeError> parseHexU8(std::string_view hex)
{
    std::uint8_t value = 0;
    if (!parseWhole(hex, value, 16))
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidHex, "invalid hex byte", hex));
    }
    return value;
}

std::expected<std::uint16_t, DecodeError> decodePortHex(std::string_view hex)
{
    std::uint16_t port = 0;
    if (!parseWhole(hex, port, 16))
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidHex, "invalid port", hex));
    }
    return port;
}

std::expected<Ipv4Bytes, DecodeError> decodeIpv4Hex(std::string_view hex)
{
    if (hex.size() != IPV4_HEX_LENGTH)
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidAddress, "IPv4 hex must be 8 digits", hex));
    }

    Ipv4Bytes bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        auto byte = parseHexU8(hex.substr(i * 2, 2));
        if (!byte)
        {
            return std::unexpected(byte.error());
        }
        bytes[3 - i] = *byte;
    }
    return bytes;
}

std::string encodeIpv4Hex(const Ipv4Bytes& address)
{
    constexpr std::string_view digits = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(IPV4_HEX_LENGTH);
    for (std::size_t i = 0; i < address.size(); ++i)
    {
        const std::uint8_t byte = address[3 - i];
        hex += digits[byte >> 4U];
        hex += digits[byte & 0x0FU];
    }
    return hex;
}

std::expected<Ipv6Bytes, DecodeError> decodeIpv6Hex(std::string_view hex)
{
    if (hex.size() != IPV6_HEX_LENGTH)
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidAddress, "IPv6 hex must be 32 digits", hex));
    }

    Ipv6Bytes bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        auto byte = parseHexU8(hex.substr(i * 2, 2));
        if (!byte)
        {
            return std::unexpected(byte.error());
        }
        bytes[i] = *byte;
    }
    return bytes;
}

std::string formatIpv4(const Ipv4Bytes& address)
{
    std::string text;
    text.reserve(15);
    for (std::size_t i = 0; i < address.size(); ++i)
    {
        if (i > 0)
        {
            text += '.';
        }
        text += std::to_string(address[i]);
    }
    return text;
}

std::string formatIpv6(const Ipv6Bytes& address)
{
    in6_addr raw{};
    std::copy(address.begin(), address.end(), std::begin(raw.s6_addr));

    std::array<char, INET6_ADDRSTRLEN> buffer{};
    if (inet_ntop(AF_INET6, &raw, buffer.data(), static_cast<socklen_t>(buffer.size())) == nullptr)
    {
        return "::";
    }
    return std::string(buffer.data());
}

std::expected<std::pair<std::string_view, std::string_view>, DecodeError> splitSocketAddress(std::string_view field)
{
    const auto colon = field.find(':');
    if (colon == std::string_view::npos || field.find(':', colon + 1) != std::string_view::npos)
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidAddress, "invalid socket address format", field));
    }
    return std::pair{field.substr(0, colon), field.substr(colon + 1)};
}

std::expected<std::string, DecodeError> decodeSocketAddress(std::string_view field)
{
    auto parts = splitSocketAddress(field);
    if (!parts)
    {
        return std::unexpected(parts.error());
    }
    const auto [ipHex, portHex] = *parts;

    auto port = decodePortHex(portHex);
    if (!port)
    {
        return std::unexpected(port.error());
    }

    if (ipHex.size() == IPV4_HEX_LENGTH)
    {
        auto ip = decodeIpv4Hex(ipHex);
        if (!ip)
        {
            return std::unexpected(ip.error());
        }
        return formatIpv4(*ip) + ":" + std::to_string(*port);
    }

    if (ipHex.size() == IPV6_HEX_LENGTH)
    {
        auto ip = decodeIpv6Hex(ipHex);
        if (!ip)
        {
            return std::unexpected(ip.error());
        }
        return "[" + formatIpv6(*ip) + "]:" + std::to_string(*port);
    }

    return std::unexpected(makeError(DecodeErrorKind::InvalidAddress, "unexpected address length", ipHex));
}

std::string decodeTcpState(std::string_view hex)
{
    auto value = parseHexU8(hex);
    if (!value)
    {
        return "UNKNOWN";
    }
    if (*value >= 1 && *value <= TCP_STATE_NAMES.size())
    {
        return std::string(TCP_STATE_NAMES[*value - 1]);
    }
    return "UNKNOWN(" + std::to_string(*value) + ")";
}

std::expected<std::uint64_t, DecodeError> parseInode(std::string_view decimal)
{
    std::uint64_t inode = 0;
    if (!parseWhole(decimal, inode, 10))
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidDecimal, "invalid inode", decimal));
    }
    return inode;
}

std::expected<std::int32_t, DecodeError> validatePid(std::string_view pid)
{
    const bool allDigits = !pid.empty() && std::ranges::all_of(pid, [](char c) { return c >= '0' && c <= '9'; });
    std::int32_t value = 0;
    if (!allDigits || !parseWhole(pid, value, 10))
    {
        return std::unexpected(makeError(DecodeErrorKind::InvalidPid, "invalid pid", pid));
    }
    return value;
}

std::expected<SocketLine, DecodeError> parseSocketLine(std::string_view line)
{
    const auto fields = splitWhitespace(line);
    if (fields.size() < MIN_SOCKET_LINE_FIELDS)
    {
        return std::unexpected(makeError(DecodeErrorKind::TooFewFields, "too few fields in", line));
    }

    auto local = decodeSocketAddress(fields[1]);
    if (!local)
    {
        return std::unexpected(local.error());
    }
    auto remote = decodeSocketAddress(fields[2]);
    if (!remote)
    {
        return std::unexpected(remote.error());
    }

    SocketLine parsed;
    parsed.local = std::move(*local);
    parsed.remote = std::move(*remote);
    parsed.state = decodeTcpState(fields[3]);
    parsed.inode = parseInode(fields[9]).value_or(0);
    return parsed;
}

} // namespace Platform::ProcNet
