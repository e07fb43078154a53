#pragma once

#include "Platform/IReverseLookup.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace Platform
{

struct HostCommandConfig
{
    std::string command = "host";
    std::chrono::milliseconds timeout{5000};
};

/// Reverse lookup through an external `host <ip>` style command.
/// The command is exec'd directly (no shell) with stdout captured; stderr goes to /dev/null.
class HostCommandLookup : public IReverseLookup
{
  public:
    explicit HostCommandLookup(HostCommandConfig config = {});
    ~HostCommandLookup() override = default;

    HostCommandLookup(const HostCommandLookup&) = delete;
    HostCommandLookup& operator=(const HostCommandLookup&) = delete;
    HostCommandLookup(HostCommandLookup&&) = delete;
    HostCommandLookup& operator=(HostCommandLookup&&) = delete;

    [[nodiscard]] std::expected<std::string, LookupError> reverseLookup(const std::string& ip, std::stop_token stopToken) override;

    /// Hostname from the first "domain name pointer" / "is an alias for" line, trailing dot removed.
    [[nodiscard]] static std::optional<std::string> parseHostOutput(std::string_view output);

    /// True for textual IPv4 or IPv6 addresses (no brackets, no port).
    [[nodiscard]] static bool isIpAddressText(const std::string& ip);

    [[nodiscard]] const HostCommandConfig& config() const noexcept
    {
        return m_Config;
    }

  private:
    HostCommandConfig m_Config;
};

} // namespace Platform
