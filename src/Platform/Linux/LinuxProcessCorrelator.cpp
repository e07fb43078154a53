#include "LinuxProcessCorrelator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace Platform
{

LinuxProcessCorrelator::LinuxProcessCorrelator(std::filesystem::path procRoot, std::chrono::milliseconds updateInterval)
    : m_ProcRoot(std::move(procRoot)), m_UpdateInterval(updateInterval), m_Tables(std::make_shared<const CacheTables>())
{
    spdlog::debug("LinuxProcessCorrelator: root={}, update interval {}ms", m_ProcRoot.string(), m_UpdateInterval.count());
}

ProcessIdentity LinuxProcessCorrelator::processInfo(std::uint64_t inode)
{
    if (inode == 0)
    {
        return ProcessIdentity::unavailable();
    }

    const auto tables = currentTables();

    if (auto pidIt = tables->inodeToPid.find(inode); pidIt != tables->inodeToPid.end())
    {
        if (auto procIt = tables->pidToProcess.find(pidIt->second); procIt != tables->pidToProcess.end())
        {
            return ProcessIdentity{.program = procIt->second.name, .pid = std::to_string(pidIt->second), .command = procIt->second.command};
        }
    }

    // Socket created since the last rebuild
    m_FallbackScans.fetch_add(1);
    return directLookup(inode).value_or(ProcessIdentity::unavailable());
}

std::shared_ptr<const LinuxProcessCorrelator::CacheTables> LinuxProcessCorrelator::currentTables()
{
    {
        std::lock_guard lock(m_Mutex);
        const auto age = std::chrono::steady_clock::now() - m_LastUpdate;
        if (m_HasTables && age <= m_UpdateInterval)
        {
            return m_Tables;
        }
    }

    rebuild();

    std::lock_guard lock(m_Mutex);
    return m_Tables;
}

void LinuxProcessCorrelator::rebuild()
{
    // Build outside the lock; readers keep using the previous tables meanwhile.
    auto built = buildTables();

    std::lock_guard lock(m_Mutex);
    if (!built)
    {
        if (!m_EnumerationFailing)
        {
            spdlog::warn("LinuxProcessCorrelator: cannot enumerate processes: {}", built.error().message());
        }
        m_EnumerationFailing = true;
        built = CacheTables{};
    }
    else if (m_EnumerationFailing)
    {
        spdlog::info("LinuxProcessCorrelator: {} readable again", m_ProcRoot.string());
        m_EnumerationFailing = false;
    }

    auto tables = std::make_shared<const CacheTables>(std::move(*built));
    spdlog::debug("LinuxProcessCorrelator: rebuilt cache ({} sockets, {} processes)", tables->inodeToPid.size(), tables->pidToProcess.size());
    m_Tables = std::move(tables);
    m_LastUpdate = std::chrono::steady_clock::now();
    m_HasTables = true;
}

void LinuxProcessCorrelator::clear()
{
    std::lock_guard lock(m_Mutex);
    m_Tables = std::make_shared<const CacheTables>();
    m_HasTables = false;
}

void LinuxProcessCorrelator::setUpdateInterval(std::chrono::milliseconds interval)
{
    std::lock_guard lock(m_Mutex);
    m_UpdateInterval = interval;
}

std::chrono::milliseconds LinuxProcessCorrelator::updateInterval() const
{
    std::lock_guard lock(m_Mutex);
    return m_UpdateInterval;
}

std::size_t LinuxProcessCorrelator::cachedInodeCount() const
{
    std::lock_guard lock(m_Mutex);
    return m_Tables->inodeToPid.size();
}

std::size_t LinuxProcessCorrelator::cachedProcessCount() const
{
    std::lock_guard lock(m_Mutex);
    return m_Tables->pidToProcess.size();
}

std::expected<LinuxProcessCorrelator::CacheTables, ProcReadError> LinuxProcessCorrelator::buildTables() const
{
    CacheTables tables;
    tables.inodeToPid.reserve(1024);
    tables.pidToProcess.reserve(512);

    const auto now = std::chrono::steady_clock::now();

    auto result = ProcFs::forEachPid(m_ProcRoot,
                                     [&](std::int32_t pid, const std::filesystem::path& pidDir)
                                     {
                                         auto name = ProcFs::readProcessName(pidDir);
                                         if (!name || name->empty())
                                         {
                                             return; // Exited, or status not readable
                                         }

                                         tables.pidToProcess.emplace(
                                             pid,
                                             ProcessInfo{.name = std::move(*name),
                                                         .command = ProcFs::readProcessCommand(pidDir, pid).value_or(std::string(NOT_AVAILABLE)),
                                                         .lastSeen = now});

                                         for (const std::uint64_t inode : ProcFs::collectSocketInodes(pidDir))
                                         {
                                             tables.inodeToPid[inode] = pid;
                                         }
                                     });

    if (!result)
    {
        return std::unexpected(result.error());
    }

    return tables;
}

std::optional<ProcessIdentity> LinuxProcessCorrelator::directLookup(std::uint64_t inode) const
{
    std::optional<ProcessIdentity> found;

    auto result = ProcFs::forEachPid(m_ProcRoot,
                                     [&](std::int32_t pid, const std::filesystem::path& pidDir)
                                     {
                                         if (found)
                                         {
                                             return;
                                         }

                                         const auto inodes = ProcFs::collectSocketInodes(pidDir);
                                         if (std::ranges::find(inodes, inode) == inodes.end())
                                         {
                                             return;
                                         }

                                         found = ProcessIdentity{
                                             .program = ProcFs::readProcessName(pidDir).value_or(std::string(NOT_AVAILABLE)),
                                             .pid = std::to_string(pid),
                                             .command = ProcFs::readProcessCommand(pidDir, pid).value_or(std::string(NOT_AVAILABLE))};
                                     });

    if (!result)
    {
        spdlog::debug("LinuxProcessCorrelator: direct lookup for inode {} failed: {}", inode, result.error().message());
    }
    return found;
}

} // namespace Platform
