#pragma once

#include "Platform/IProcessCorrelator.h"
#include "ProcFs.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Platform
{

/// Default lifetime of the inode -> process cache.
inline constexpr auto DEFAULT_PROCESS_CACHE_INTERVAL = std::chrono::milliseconds(5000);

/// Linux implementation of IProcessCorrelator.
/// Scans <proc>/<pid>/fd for "socket:[inode]" links and caches the result for updateInterval().
/// A cache miss falls back to a direct scan for that one inode, so new sockets resolve immediately.
class LinuxProcessCorrelator : public IProcessCorrelator
{
  public:
    explicit LinuxProcessCorrelator(std::filesystem::path procRoot = ProcFs::DEFAULT_PROC_ROOT,
                                    std::chrono::milliseconds updateInterval = DEFAULT_PROCESS_CACHE_INTERVAL);
    ~LinuxProcessCorrelator() override = default;

    LinuxProcessCorrelator(const LinuxProcessCorrelator&) = delete;
    LinuxProcessCorrelator& operator=(const LinuxProcessCorrelator&) = delete;
    LinuxProcessCorrelator(LinuxProcessCorrelator&&) = delete;
    LinuxProcessCorrelator& operator=(LinuxProcessCorrelator&&) = delete;

    [[nodiscard]] ProcessIdentity processInfo(std::uint64_t inode) override;

    /// Rebuild both maps now, regardless of age.
    void rebuild();

    /// Drop cached data; the next lookup rebuilds.
    void clear();

    void setUpdateInterval(std::chrono::milliseconds interval);
    [[nodiscard]] std::chrono::milliseconds updateInterval() const;

    [[nodiscard]] std::size_t cachedInodeCount() const;
    [[nodiscard]] std::size_t cachedProcessCount() const;

    /// Number of direct scans triggered by cache misses.
    [[nodiscard]] std::uint64_t fallbackScanCount() const noexcept
    {
        return m_FallbackScans.load();
    }

  private:
    struct ProcessInfo
    {
        std::string name;
        std::string command;
        std::chrono::steady_clock::time_point lastSeen;
    };

    /// Immutable once published; replaced wholesale on rebuild.
    struct CacheTables
    {
        std::unordered_map<std::uint64_t, std::int32_t> inodeToPid;
        std::unordered_map<std::int32_t, ProcessInfo> pidToProcess;
    };

    [[nodiscard]] std::shared_ptr<const CacheTables> currentTables();
    [[nodiscard]] std::expected<CacheTables, ProcReadError> buildTables() const;
    [[nodiscard]] std::optional<ProcessIdentity> directLookup(std::uint64_t inode) const;

    std::filesystem::path m_ProcRoot;

    mutable std::mutex m_Mutex; // Guards the fields below
    std::chrono::milliseconds m_UpdateInterval;
    std::shared_ptr<const CacheTables> m_Tables;
    std::chrono::steady_clock::time_point m_LastUpdate{};
    bool m_HasTables = false;
    bool m_EnumerationFailing = false;

    std::atomic<std::uint64_t> m_FallbackScans{0};
};

} // namespace Platform
