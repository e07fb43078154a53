#include "App/UserConfig.h"
#include "Domain/AddressResolver.h"
#include "Domain/BackgroundSampler.h"
#include "Domain/ConnectionMonitor.h"
#include "Platform/Factory.h"
#include "UI/Format.h"
#include "version.h"

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{

volatile std::sig_atomic_t g_StopRequested = 0;

constexpr std::size_t COMMAND_COLUMN_WIDTH = 60;

void onTerminateSignal(int /*signal*/)
{
    g_StopRequested = 1;
}

[[nodiscard]] auto truncated(const std::string& text, std::size_t width) -> std::string
{
    if (text.size() <= width)
    {
        return text;
    }
    return text.substr(0, width - 3) + "...";
}

void printTable(std::vector<Platform::Connection> connections,
                std::uint64_t refreshCount,
                const Platform::ProcessIoCounters& totals,
                Domain::AddressResolver& resolver)
{
    // Loopback traffic is hidden
    std::erase_if(connections, [&resolver](const Platform::Connection& connection)
                  { return resolver.resolveAddress(connection.remote) == "LOCALHOST"; });

    // Busiest first
    std::ranges::stable_sort(connections,
                             [](const Platform::Connection& lhs, const Platform::Connection& rhs)
                             { return (lhs.rxRate + lhs.txRate) > (rhs.rxRate + rhs.txRate); });

    fmt::print("\n#{}\n", refreshCount);
    fmt::print("{:<24} {:<5} {:<46} {:<46} {:<12} {:>12} {:>12}  {}\n", "PROCESS", "PROTO", "LOCAL", "REMOTE", "STATE", "TX", "RX", "COMMAND");

    for (const auto& connection : connections)
    {
        fmt::print("{:<24} {:<5} {:<46} {:<46} {:<12} {:>12} {:>12}  {}\n",
                   truncated(UI::Format::processDisplay(connection), 24),
                   connection.protocol,
                   connection.local,
                   resolver.resolveAddress(connection.remote),
                   connection.state,
                   UI::Format::formatBytesPerSecond(connection.txRate),
                   UI::Format::formatBytesPerSecond(connection.rxRate),
                   truncated(connection.command, COMMAND_COLUMN_WIDTH));
    }

    const auto active = std::ranges::count_if(connections, UI::Format::isActive);
    fmt::print("{} total connections, {} active | Sent: {} | Received: {}\n",
               connections.size(),
               active,
               UI::Format::formatBytesTotal(totals.tx),
               UI::Format::formatBytesTotal(totals.rx));
    std::fflush(stdout);
}

auto runApp() -> int
{
    // Diagnostics go to stderr; stdout carries the table.
    auto logger = spdlog::stderr_color_mt("sockwatch");
    spdlog::set_default_logger(logger);

    auto& userConfig = App::UserConfig::get();
    userConfig.load();
    const auto settings = userConfig.settings();

    spdlog::set_level(spdlog::level::from_str(settings.logLevel));
#ifndef NDEBUG
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_on(spdlog::level::debug);
#endif

    spdlog::info("{} v{} ({} build)", sockwatch::Version::PROJECT_NAME, sockwatch::Version::STRING, sockwatch::Version::BUILD_TYPE);
    spdlog::debug("Compiler: {} {}", sockwatch::Version::COMPILER_ID, sockwatch::Version::COMPILER_VERSION);
    spdlog::debug("Built: {} {}", sockwatch::Version::BUILD_DATE, sockwatch::Version::BUILD_TIME);

    auto correlator = Platform::makeProcessCorrelator(std::chrono::milliseconds(settings.processCacheIntervalMs));
    auto monitor = std::make_shared<Domain::ConnectionMonitor>(
        Platform::makeSocketTableReader(correlator),
        Platform::makeProcessIoProbe(),
        Domain::MonitorConfig{.failureThreshold = static_cast<std::uint32_t>(settings.breakerFailureThreshold),
                              .breakerTimeout = std::chrono::seconds(settings.breakerTimeoutSeconds)});

    Domain::AddressResolver resolver(Platform::makeReverseLookup(settings.resolverCommand, std::chrono::milliseconds(settings.resolverTimeoutMs)),
                                     Domain::ResolverConfig{.enabled = settings.resolveHosts,
                                                            .workers = static_cast<std::size_t>(settings.resolverWorkers),
                                                            .maxQueue = static_cast<std::size_t>(settings.resolverMaxQueue)});

    Domain::BackgroundSampler sampler(monitor, Domain::SamplerConfig{.interval = std::chrono::milliseconds(settings.refreshIntervalMs)});
    sampler.setCallback([&resolver, &monitor](const std::vector<Platform::Connection>& connections, std::uint64_t refreshCount)
                        { printTable(connections, refreshCount, monitor->ioTotals(), resolver); });

    std::signal(SIGINT, onTerminateSignal);
    std::signal(SIGTERM, onTerminateSignal);

    sampler.start();
    while (g_StopRequested == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutting down");
    sampler.stop();
    resolver.shutdown();

    if (auto error = monitor->lastError())
    {
        spdlog::warn("Last refresh failed: {}", error->describe());
    }

    return 0;
}

} // namespace

auto main() -> int
{
    return runApp();
}
