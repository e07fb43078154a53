#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace Platform
{

/// Kernel socket tables exposed under <proc>/net.
enum class SocketProtocol : std::uint8_t
{
    Tcp,
    Tcp6,
    Udp,
    Udp6,
};

inline constexpr std::array<SocketProtocol, 4> ALL_SOCKET_PROTOCOLS = {
    SocketProtocol::Tcp,
    SocketProtocol::Tcp6,
    SocketProtocol::Udp,
    SocketProtocol::Udp6,
};

/// Protocol label as shown to the user, which is also the table's file name.
[[nodiscard]] constexpr std::string_view toString(SocketProtocol protocol) noexcept
{
    switch (protocol)
    {
    case SocketProtocol::Tcp:
        return "tcp";
    case SocketProtocol::Tcp6:
        return "tcp6";
    case SocketProtocol::Udp:
        return "udp";
    case SocketProtocol::Udp6:
        return "udp6";
    }
    return "unknown";
}

inline constexpr std::string_view NOT_AVAILABLE = "N/A";

/// Owning process of a socket, already rendered for display.
struct ProcessIdentity
{
    std::string program{NOT_AVAILABLE};
    std::string pid{NOT_AVAILABLE};
    std::string command{NOT_AVAILABLE};

    [[nodiscard]] static ProcessIdentity unavailable()
    {
        return {};
    }

    [[nodiscard]] bool isKnown() const noexcept
    {
        return pid != NOT_AVAILABLE;
    }

    bool operator==(const ProcessIdentity&) const = default;
};

/// One observed socket. Built fresh every refresh; rates are stamped by the domain layer.
struct Connection
{
    std::string protocol;
    std::string state;  // Textual TCP state (decoded for UDP too)
    std::string local;  // ip:port, IPv6 as [addr]:port
    std::string remote; // ip:port, IPv6 as [addr]:port
    std::string program{NOT_AVAILABLE};
    std::string pid{NOT_AVAILABLE};
    std::string command{NOT_AVAILABLE};
    std::uint64_t rxRate = 0; // bytes/sec
    std::uint64_t txRate = 0; // bytes/sec

    void setIdentity(ProcessIdentity identity)
    {
        program = std::move(identity.program);
        pid = std::move(identity.pid);
        command = std::move(identity.command);
    }
};

/// Cumulative read/write byte counters for one pid (rchar/wchar from <proc>/<pid>/io).
struct ProcessIoCounters
{
    std::uint64_t rx = 0;
    std::uint64_t tx = 0;

    bool operator==(const ProcessIoCounters&) const = default;
};

} // namespace Platform
