#include "ConnectionMonitor.h"

#include "Resilience.h"

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

namespace Domain
{

ConnectionMonitor::ConnectionMonitor(std::unique_ptr<Platform::ISocketTableReader> reader,
                                     std::unique_ptr<Platform::IProcessIoProbe> ioProbe,
                                     MonitorConfig config,
                                     CircuitBreaker::TimeSource timeSource)
    : m_Reader(std::move(reader)), m_Rates(std::move(ioProbe)), m_Breaker(config.failureThreshold, config.breakerTimeout, std::move(timeSource))
{
    spdlog::debug("ConnectionMonitor: breaker threshold {}, timeout {}ms", m_Breaker.failureThreshold(), m_Breaker.timeout().count());
}

std::expected<std::vector<Platform::Connection>, MonitorError> ConnectionMonitor::readAllTables()
{
    auto batch = Resilience::batchWithPartialFailure(
        Platform::ALL_SOCKET_PROTOCOLS,
        [this](Platform::SocketProtocol protocol) -> std::expected<std::vector<Platform::Connection>, MonitorError>
        {
            auto table = m_Reader->readTable(protocol);
            if (!table)
            {
                return std::unexpected(toMonitorError(table.error()));
            }
            return std::move(*table);
        });

    // Log per-table transitions only. Hosts without IPv6 never have a tcp6 table.
    for (const auto& failure : batch.failed)
    {
        auto& failing = m_TableFailing[static_cast<std::size_t>(failure.item)];
        if (!failing)
        {
            spdlog::debug("Cannot read {} socket table: {}", Platform::toString(failure.item), failure.error.message);
        }
        failing = true;
    }
    for (const auto& success : batch.succeeded)
    {
        auto& failing = m_TableFailing[static_cast<std::size_t>(success.item)];
        if (failing)
        {
            spdlog::debug("{} socket table readable again", Platform::toString(success.item));
        }
        failing = false;
    }

    if (batch.succeeded.empty())
    {
        if (batch.failed.empty())
        {
            return std::unexpected(MonitorError{.kind = ErrorKind::ProcIo, .message = "no socket tables"});
        }
        return std::unexpected(MonitorError{.kind = ErrorKind::ProcIo, .message = "no socket table readable (" + batch.failed.front().error.message + ")"});
    }

    std::vector<Platform::Connection> connections;
    for (auto& success : batch.succeeded)
    {
        connections.insert(connections.end(), std::make_move_iterator(success.value.begin()), std::make_move_iterator(success.value.end()));
    }
    return connections;
}

std::expected<std::size_t, MonitorError> ConnectionMonitor::refresh(Clock::time_point now)
{
    std::lock_guard refreshLock(m_RefreshMutex);

    auto connections = Resilience::withCircuitBreaker(m_Breaker, [this] { return readAllTables(); });

    if (!connections)
    {
        if (!m_Failing)
        {
            spdlog::warn("Refresh failed, keeping previous connections: {}", connections.error().describe());
        }
        m_Failing = true;

        std::lock_guard lock(m_ResultMutex);
        m_LastError = connections.error();
        return std::unexpected(std::move(connections.error()));
    }

    if (m_Failing)
    {
        spdlog::info("Refresh recovered");
    }
    m_Failing = false;

    auto update = m_Rates.updateConnectionRates(std::move(*connections), m_Snapshots, now);
    m_Snapshots = std::move(update.snapshots);
    const std::size_t count = update.connections.size();

    Platform::ProcessIoCounters totals;
    for (const auto& [pid, counters] : m_Snapshots)
    {
        totals.rx += counters.rx;
        totals.tx += counters.tx;
    }

    std::lock_guard lock(m_ResultMutex);
    m_Connections = std::move(update.connections);
    m_IoTotals = totals;
    m_LastError.reset();
    ++m_RefreshCount;
    return count;
}

std::vector<Platform::Connection> ConnectionMonitor::connections() const
{
    std::lock_guard lock(m_ResultMutex);
    return m_Connections;
}

std::optional<MonitorError> ConnectionMonitor::lastError() const
{
    std::lock_guard lock(m_ResultMutex);
    return m_LastError;
}

std::uint64_t ConnectionMonitor::refreshCount() const
{
    std::lock_guard lock(m_ResultMutex);
    return m_RefreshCount;
}

Platform::ProcessIoCounters ConnectionMonitor::ioTotals() const
{
    std::lock_guard lock(m_ResultMutex);
    return m_IoTotals;
}

} // namespace Domain
