#pragma once

#include "CircuitBreaker.h"
#include "MonitorError.h"
#include "RateCalculator.h"

#include "Platform/ConnectionTypes.h"
#include "Platform/IProcessIoProbe.h"
#include "Platform/ISocketTableReader.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Domain
{

struct MonitorConfig
{
    std::uint32_t failureThreshold = DEFAULT_FAILURE_THRESHOLD;
    std::chrono::milliseconds breakerTimeout = DEFAULT_BREAKER_TIMEOUT;
};

/// One refresh tick: read socket tables, stamp rates, publish.
///
/// Tables are read independently, so an unreadable table does not hide the others. When no table
/// can be read, or the breaker is open, the previous connections stay published and the failure
/// is available from lastError().
class ConnectionMonitor
{
  public:
    using Clock = std::chrono::steady_clock;

    ConnectionMonitor(std::unique_ptr<Platform::ISocketTableReader> reader,
                      std::unique_ptr<Platform::IProcessIoProbe> ioProbe,
                      MonitorConfig config = {},
                      CircuitBreaker::TimeSource timeSource = {});

    ConnectionMonitor(const ConnectionMonitor&) = delete;
    ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;
    ConnectionMonitor(ConnectionMonitor&&) = delete;
    ConnectionMonitor& operator=(ConnectionMonitor&&) = delete;
    ~ConnectionMonitor() = default;

    /// Run one tick. Returns the number of connections published.
    std::expected<std::size_t, MonitorError> refresh(Clock::time_point now);

    /// Copy of the last published connections.
    [[nodiscard]] std::vector<Platform::Connection> connections() const;

    /// Error of the most recent failed refresh; cleared by a successful one.
    [[nodiscard]] std::optional<MonitorError> lastError() const;

    /// Number of refreshes that published new data.
    [[nodiscard]] std::uint64_t refreshCount() const;

    /// Sum of the cumulative rchar/wchar counters of every pid in the current baseline.
    [[nodiscard]] Platform::ProcessIoCounters ioTotals() const;

    [[nodiscard]] CircuitState breakerState() const
    {
        return m_Breaker.state();
    }

  private:
    [[nodiscard]] std::expected<std::vector<Platform::Connection>, MonitorError> readAllTables();

    std::unique_ptr<Platform::ISocketTableReader> m_Reader;
    RateCalculator m_Rates;
    CircuitBreaker m_Breaker;

    std::mutex m_RefreshMutex; // Serializes refresh(); guards the fields below
    SnapshotMap m_Snapshots;
    std::array<bool, Platform::ALL_SOCKET_PROTOCOLS.size()> m_TableFailing{};
    bool m_Failing = false;

    mutable std::mutex m_ResultMutex; // Guards the published state
    std::vector<Platform::Connection> m_Connections;
    std::optional<MonitorError> m_LastError;
    std::uint64_t m_RefreshCount = 0;
    Platform::ProcessIoCounters m_IoTotals;
};

} // namespace Domain
