#pragma once

#include "Domain/SamplingConfig.h"

#include <filesystem>
#include <string>

namespace App
{

/// User configuration settings that persist across sessions
struct UserSettings
{
    // Refresh cadence (milliseconds)
    int refreshIntervalMs = Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS;

    // Lifetime of the socket inode -> process cache (milliseconds)
    int processCacheIntervalMs = Domain::Sampling::PROCESS_CACHE_DEFAULT_MS;

    // Reverse DNS for remote endpoints
    bool resolveHosts = false;
    int resolverWorkers = Domain::Sampling::RESOLVER_WORKERS_DEFAULT;
    int resolverTimeoutMs = Domain::Sampling::RESOLVER_TIMEOUT_DEFAULT_MS;
    int resolverMaxQueue = Domain::Sampling::RESOLVER_QUEUE_DEFAULT;
    std::string resolverCommand = "host";

    // Circuit breaker around each refresh
    int breakerFailureThreshold = Domain::Sampling::BREAKER_THRESHOLD_DEFAULT;
    int breakerTimeoutSeconds = Domain::Sampling::BREAKER_TIMEOUT_DEFAULT_S;

    // spdlog level name
    std::string logLevel = "info";

    bool operator==(const UserSettings&) const = default;
};

/**
 * @brief Manages user configuration persistence
 *
 * Saves/loads user preferences to a TOML file, by default
 * $XDG_CONFIG_HOME/sockwatch/config.toml (or ~/.config/sockwatch/config.toml).
 */
class UserConfig
{
  public:
    /// Get the process-wide instance at the default location
    static auto get() -> UserConfig&;

    /// Instance bound to an explicit file
    explicit UserConfig(std::filesystem::path configPath);
    ~UserConfig() = default;

    UserConfig(const UserConfig&) = delete;
    auto operator=(const UserConfig&) -> UserConfig& = delete;
    UserConfig(UserConfig&&) = delete;
    auto operator=(UserConfig&&) -> UserConfig& = delete;

    /// Load settings from config file (call on startup). Missing or invalid files keep defaults.
    void load();

    /// Save settings to config file
    void save() const;

    [[nodiscard]] auto settings() const -> const UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto settings() -> UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto configPath() const -> const std::filesystem::path&
    {
        return m_ConfigPath;
    }

    /// True for the level names spdlog understands ("trace" ... "off").
    [[nodiscard]] static auto isValidLogLevel(const std::string& level) -> bool;

  private:
    std::filesystem::path m_ConfigPath;
    UserSettings m_Settings;
    bool m_IsLoaded = false;

    static auto getConfigDirectory() -> std::filesystem::path;
};

} // namespace App
