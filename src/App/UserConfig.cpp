#include "UserConfig.h"

#include "Domain/Numeric.h"
#include "Platform/Factory.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <toml++/toml.hpp>

namespace App
{

namespace
{

constexpr std::array<std::string_view, 7> LOG_LEVEL_NAMES = {"trace", "debug", "info", "warn", "error", "critical", "off"};

/// Read an integer key, narrow it and pass it through @p clamp; missing or mistyped keys leave @p out alone.
template<typename Clamp> void readClampedInt(const toml::node_view<toml::node>& node, int& out, int fallback, Clamp clamp)
{
    if (auto val = node.value<std::int64_t>())
    {
        out = clamp(Domain::Numeric::narrowOr<int>(*val, fallback));
    }
}

} // namespace

auto UserConfig::get() -> UserConfig&
{
    static UserConfig instance(getConfigDirectory() / "config.toml");
    return instance;
}

UserConfig::UserConfig(std::filesystem::path configPath) : m_ConfigPath(std::move(configPath))
{
    spdlog::debug("Config path: {}", m_ConfigPath.string());
}

auto UserConfig::getConfigDirectory() -> std::filesystem::path
{
    return Platform::makePathProvider()->getUserConfigDir();
}

auto UserConfig::isValidLogLevel(const std::string& level) -> bool
{
    for (const auto name : LOG_LEVEL_NAMES)
    {
        if (name == level)
        {
            return true;
        }
    }
    return false;
}

void UserConfig::load()
{
    if (m_IsLoaded)
    {
        return;
    }
    m_IsLoaded = true;

    std::error_code ec;
    if (!std::filesystem::exists(m_ConfigPath, ec))
    {
        spdlog::info("No config file found at {}, using defaults", m_ConfigPath.string());
        return;
    }

    try
    {
        auto config = toml::parse_file(m_ConfigPath.string());

        using namespace Domain::Sampling;

        readClampedInt(config["sampling"]["interval_ms"], m_Settings.refreshIntervalMs, REFRESH_INTERVAL_DEFAULT_MS,
                       clampRefreshInterval<int>);
        readClampedInt(config["process_cache"]["update_interval_ms"], m_Settings.processCacheIntervalMs, PROCESS_CACHE_DEFAULT_MS,
                       clampProcessCacheInterval<int>);

        if (auto val = config["resolver"]["enabled"].value<bool>())
        {
            m_Settings.resolveHosts = *val;
        }
        readClampedInt(config["resolver"]["workers"], m_Settings.resolverWorkers, RESOLVER_WORKERS_DEFAULT, clampResolverWorkers<int>);
        readClampedInt(config["resolver"]["lookup_timeout_ms"], m_Settings.resolverTimeoutMs, RESOLVER_TIMEOUT_DEFAULT_MS,
                       clampResolverTimeout<int>);
        readClampedInt(config["resolver"]["max_queue"], m_Settings.resolverMaxQueue, RESOLVER_QUEUE_DEFAULT, clampResolverQueue<int>);
        if (auto command = config["resolver"]["command"].value<std::string>(); command && !command->empty())
        {
            m_Settings.resolverCommand = *command;
        }

        readClampedInt(config["resilience"]["failure_threshold"], m_Settings.breakerFailureThreshold, BREAKER_THRESHOLD_DEFAULT,
                       clampBreakerThreshold<int>);
        readClampedInt(config["resilience"]["timeout_seconds"], m_Settings.breakerTimeoutSeconds, BREAKER_TIMEOUT_DEFAULT_S,
                       clampBreakerTimeout<int>);

        if (auto level = config["logging"]["level"].value<std::string>())
        {
            if (isValidLogLevel(*level))
            {
                m_Settings.logLevel = *level;
            }
            else
            {
                spdlog::warn("Ignoring unknown log level '{}' in {}", *level, m_ConfigPath.string());
            }
        }

        spdlog::info("Loaded config from {}", m_ConfigPath.string());
    }
    catch (const toml::parse_error& err)
    {
        spdlog::error("Failed to parse config file: {}", err.what());
    }
}

void UserConfig::save() const
{
    // Ensure config directory exists
    const std::filesystem::path configDir = m_ConfigPath.parent_path();
    if (!configDir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(configDir, ec);
        if (ec)
        {
            spdlog::error("Failed to create config directory {}: {}", configDir.string(), ec.message());
            return;
        }
    }

    using namespace Domain::Sampling;

    auto config = toml::table{
        {"sampling", toml::table{{"interval_ms", clampRefreshInterval(m_Settings.refreshIntervalMs)}}},
        {"process_cache", toml::table{{"update_interval_ms", clampProcessCacheInterval(m_Settings.processCacheIntervalMs)}}},
        {"resolver",
         toml::table{
             {"enabled", m_Settings.resolveHosts},
             {"workers", clampResolverWorkers(m_Settings.resolverWorkers)},
             {"lookup_timeout_ms", clampResolverTimeout(m_Settings.resolverTimeoutMs)},
             {"max_queue", clampResolverQueue(m_Settings.resolverMaxQueue)},
             {"command", m_Settings.resolverCommand},
         }},
        {"resilience",
         toml::table{
             {"failure_threshold", clampBreakerThreshold(m_Settings.breakerFailureThreshold)},
             {"timeout_seconds", clampBreakerTimeout(m_Settings.breakerTimeoutSeconds)},
         }},
        {"logging", toml::table{{"level", m_Settings.logLevel}}},
    };

    std::ofstream file(m_ConfigPath);
    if (!file)
    {
        spdlog::error("Failed to open config file for writing: {}", m_ConfigPath.string());
        return;
    }

    file << "# SockWatch user configuration\n";
    file << "# This file is auto-generated. Manual edits are preserved.\n";
    file << "# Notes:\n";
    file << "# - sampling.interval_ms: refresh cadence (100..5000 ms).\n";
    file << "# - process_cache.update_interval_ms: how long socket ownership is cached (0 rebuilds every lookup).\n";
    file << "# - resolver.command is run as '<command> <ip>' and must print 'domain name pointer' lines.\n\n";
    file << config;

    spdlog::info("Saved config to {}", m_ConfigPath.string());
}

} // namespace App
