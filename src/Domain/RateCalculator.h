#pragma once

#include "Platform/ConnectionTypes.h"
#include "Platform/IProcessIoProbe.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// Cumulative I/O counters per pid at one refresh.
using SnapshotMap = std::unordered_map<std::int32_t, Platform::ProcessIoCounters>;

struct RateUpdate
{
    std::vector<Platform::Connection> connections; // rxRate/txRate stamped
    SnapshotMap snapshots;                         // baseline for the next call
};

/// Stamps per-connection throughput from the owning process's rchar/wchar deltas.
///
/// Rates are per process: every connection of a pid shows the same numbers.
/// The elapsed time is measured between successive calls using the caller's clock.
class RateCalculator
{
  public:
    using Clock = std::chrono::steady_clock;

    /// Lower bound on the elapsed time between calls, in seconds.
    static constexpr double MIN_ELAPSED_SECONDS = 0.001;

    /// Elapsed time assumed for the very first call.
    static constexpr double INITIAL_ELAPSED_SECONDS = 1.0;

    explicit RateCalculator(std::unique_ptr<Platform::IProcessIoProbe> probe);

    [[nodiscard]] Platform::ProcessIoCounters processIo(std::int32_t pid);

    /// Stamp rates on @p connections against @p previous and return the new baseline.
    /// Connections whose pid has no previous snapshot get zero rates.
    [[nodiscard]] RateUpdate updateConnectionRates(std::vector<Platform::Connection> connections, const SnapshotMap& previous, Clock::time_point now);

    /// Forget the time of the last call.
    void reset() noexcept
    {
        m_LastUpdate.reset();
    }

    [[nodiscard]] std::optional<Clock::time_point> lastUpdate() const noexcept
    {
        return m_LastUpdate;
    }

  private:
    std::unique_ptr<Platform::IProcessIoProbe> m_Probe;
    std::optional<Clock::time_point> m_LastUpdate;
};

} // namespace Domain
