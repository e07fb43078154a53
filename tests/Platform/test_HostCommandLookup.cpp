/// @file test_HostCommandLookup.cpp
/// @brief Tests for Platform::HostCommandLookup output parsing and subprocess handling.
///
/// Subprocess tests run small /bin/sh scripts written to a temp directory in place of `host`.

#if defined(__linux__)

#include "Platform/Linux/HostCommandLookup.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>

namespace Platform
{
namespace
{

using namespace std::chrono_literals;

// =============================================================================
// Output Parsing
// =============================================================================

TEST(HostCommandLookupTest, ParsesPointerRecord)
{
    const auto name = HostCommandLookup::parseHostOutput("8.8.8.8.in-addr.arpa domain name pointer dns.google.\n");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "dns.google");
}

TEST(HostCommandLookupTest, ParsesAliasRecord)
{
    const auto name = HostCommandLookup::parseHostOutput(
        "4.3.2.1.in-addr.arpa is an alias for 4.0/24.3.2.1.in-addr.arpa.\n"
        "4.0/24.3.2.1.in-addr.arpa domain name pointer host.example.net.\n");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "4.0/24.3.2.1.in-addr.arpa");
}

TEST(HostCommandLookupTest, FirstPointerWinsWhenSeveralAreListed)
{
    const auto name = HostCommandLookup::parseHostOutput(
        "1.0.0.127.in-addr.arpa domain name pointer localhost.\n"
        "1.0.0.127.in-addr.arpa domain name pointer localhost.localdomain.\n");
    EXPECT_EQ(name.value_or(""), "localhost");
}

TEST(HostCommandLookupTest, NotFoundOutputHasNoName)
{
    EXPECT_FALSE(HostCommandLookup::parseHostOutput("Host 10.0.0.1.in-addr.arpa. not found: 3(NXDOMAIN)\n").has_value());
    EXPECT_FALSE(HostCommandLookup::parseHostOutput("").has_value());
    EXPECT_FALSE(HostCommandLookup::parseHostOutput("x domain name pointer\n").has_value());
}

TEST(HostCommandLookupTest, IpAddressValidation)
{
    EXPECT_TRUE(HostCommandLookup::isIpAddressText("192.168.1.10"));
    EXPECT_TRUE(HostCommandLookup::isIpAddressText("2001:db8::1"));
    EXPECT_TRUE(HostCommandLookup::isIpAddressText("::"));
    EXPECT_FALSE(HostCommandLookup::isIpAddressText("-V"));
    EXPECT_FALSE(HostCommandLookup::isIpAddressText("[::1]"));
    EXPECT_FALSE(HostCommandLookup::isIpAddressText("1.2.3.4:80"));
    EXPECT_FALSE(HostCommandLookup::isIpAddressText("example.com"));
    EXPECT_FALSE(HostCommandLookup::isIpAddressText(""));
}

// =============================================================================
// Subprocess Handling
// =============================================================================

class HostCommandLookupProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        m_TempDir = std::filesystem::temp_directory_path() /
                    ("sockwatch_host_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(m_TempDir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_TempDir, ec);
    }

    /// Write an executable /bin/sh script and return its path.
    [[nodiscard]] std::string writeScript(const std::string& name, const std::string& body) const
    {
        const auto path = m_TempDir / name;
        {
            std::ofstream file(path);
            file << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
        return path.string();
    }

    std::filesystem::path m_TempDir;
};

TEST_F(HostCommandLookupProcessTest, ResolvesThroughCommandOutput)
{
    const auto script = writeScript("fakehost", "echo \"$1.in-addr.arpa domain name pointer box.example.org.\"");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 5s});

    const auto result = lookup.reverseLookup("10.1.2.3", std::stop_token{});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, "box.example.org");
}

TEST_F(HostCommandLookupProcessTest, NoPointerIsNoRecord)
{
    const auto script = writeScript("nxdomain", "echo \"Host $1 not found: 3(NXDOMAIN)\"; exit 1");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 5s});

    const auto result = lookup.reverseLookup("10.1.2.3", std::stop_token{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::NoRecord);
}

TEST_F(HostCommandLookupProcessTest, MissingCommandIsUnavailable)
{
    HostCommandLookup lookup(HostCommandConfig{.command = (m_TempDir / "does-not-exist").string(), .timeout = 5s});

    const auto result = lookup.reverseLookup("10.1.2.3", std::stop_token{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::CommandUnavailable);
}

TEST_F(HostCommandLookupProcessTest, SlowCommandTimesOut)
{
    const auto script = writeScript("slowhost", "exec sleep 10");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 300ms});

    const auto start = std::chrono::steady_clock::now();
    const auto result = lookup.reverseLookup("10.1.2.3", std::stop_token{});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::TimedOut);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(HostCommandLookupProcessTest, StopRequestCancelsRunningLookup)
{
    const auto script = writeScript("hanghost", "exec sleep 10");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 20s});

    std::stop_source stopSource;
    std::jthread canceller(
        [&stopSource]
        {
            std::this_thread::sleep_for(200ms);
            stopSource.request_stop();
        });

    const auto start = std::chrono::steady_clock::now();
    const auto result = lookup.reverseLookup("10.1.2.3", stopSource.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::Cancelled);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(HostCommandLookupProcessTest, AlreadyStoppedTokenNeverSpawns)
{
    HostCommandLookup lookup(HostCommandConfig{.command = (m_TempDir / "does-not-exist").string(), .timeout = 5s});
    std::stop_source stopSource;
    stopSource.request_stop();

    const auto result = lookup.reverseLookup("10.1.2.3", stopSource.get_token());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::Cancelled);
}

TEST_F(HostCommandLookupProcessTest, TimeoutAppliesAfterOutputCloses)
{
    const auto script = writeScript("detached", "exec >&-; exec sleep 10");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 500ms});

    const auto start = std::chrono::steady_clock::now();
    const auto result = lookup.reverseLookup("10.1.2.3", std::stop_token{});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::TimedOut);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(HostCommandLookupProcessTest, StopRequestAppliesAfterOutputCloses)
{
    const auto script = writeScript("detached", "exec >&-; exec sleep 10");
    HostCommandLookup lookup(HostCommandConfig{.command = script, .timeout = 20s});

    std::stop_source stopSource;
    std::jthread canceller(
        [&stopSource]
        {
            std::this_thread::sleep_for(200ms);
            stopSource.request_stop();
        });

    const auto start = std::chrono::steady_clock::now();
    const auto result = lookup.reverseLookup("10.1.2.3", stopSource.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::Cancelled);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(HostCommandLookupProcessTest, InvalidAddressNeverSpawns)
{
    HostCommandLookup lookup(HostCommandConfig{.command = (m_TempDir / "does-not-exist").string(), .timeout = 5s});

    const auto result = lookup.reverseLookup("--help", std::stop_token{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, LookupErrorKind::InvalidAddress);
}

TEST(HostCommandLookupConfigTest, DefaultsToHostCommand)
{
    HostCommandLookup lookup;
    EXPECT_EQ(lookup.config().command, "host");
    EXPECT_EQ(lookup.config().timeout, 5000ms);
}

} // namespace
} // namespace Platform

#endif // __linux__
