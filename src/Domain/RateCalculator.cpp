#include "RateCalculator.h"

#include "Numeric.h"
#include "Platform/Linux/ProcNetDecoder.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace Domain
{

RateCalculator::RateCalculator(std::unique_ptr<Platform::IProcessIoProbe> probe) : m_Probe(std::move(probe))
{
}

Platform::ProcessIoCounters RateCalculator::processIo(std::int32_t pid)
{
    if (!m_Probe)
    {
        return {};
    }
    return m_Probe->readProcessIo(pid);
}

RateUpdate RateCalculator::updateConnectionRates(std::vector<Platform::Connection> connections, const SnapshotMap& previous, Clock::time_point now)
{
    double elapsedSeconds = INITIAL_ELAPSED_SECONDS;
    if (m_LastUpdate)
    {
        elapsedSeconds = std::chrono::duration<double>(now - *m_LastUpdate).count();
    }
    elapsedSeconds = std::max(elapsedSeconds, MIN_ELAPSED_SECONDS);
    m_LastUpdate = now;

    RateUpdate update;
    update.snapshots.reserve(previous.size());

    for (auto& connection : connections)
    {
        connection.rxRate = 0;
        connection.txRate = 0;

        if (connection.pid == Platform::NOT_AVAILABLE)
        {
            continue;
        }

        const auto pid = Platform::ProcNet::validatePid(connection.pid);
        if (!pid)
        {
            spdlog::debug("Skipping rate for connection with {}", pid.error().message);
            continue;
        }

        // One read per distinct pid per call
        auto [it, inserted] = update.snapshots.try_emplace(*pid);
        if (inserted)
        {
            it->second = processIo(*pid);
        }
        const auto& current = it->second;

        const auto prevIt = previous.find(*pid);
        if (prevIt == previous.end())
        {
            continue; // First observation
        }

        connection.rxRate = Numeric::bytesPerSecond(Numeric::saturatingSub(current.rx, prevIt->second.rx), elapsedSeconds);
        connection.txRate = Numeric::bytesPerSecond(Numeric::saturatingSub(current.tx, prevIt->second.tx), elapsedSeconds);
    }

    update.connections = std::move(connections);
    return update;
}

} // namespace Domain
