#include "BackgroundSampler.h"

#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>

namespace Domain
{

BackgroundSampler::BackgroundSampler(std::shared_ptr<ConnectionMonitor> monitor, SamplerConfig config)
    : m_Monitor(std::move(monitor)), m_Config(config)
{
    spdlog::debug("BackgroundSampler: created with {}ms interval", m_Config.interval.count());
}

BackgroundSampler::~BackgroundSampler()
{
    stop();
}

void BackgroundSampler::start()
{
    if (m_Running.load())
    {
        spdlog::warn("BackgroundSampler: already running");
        return;
    }

    spdlog::info("BackgroundSampler: starting with {}ms interval", interval().count());
    m_Running.store(true);
    m_SamplerThread = std::jthread([this](std::stop_token st) { samplerLoop(st); });
}

void BackgroundSampler::stop()
{
    if (!m_Running.load())
    {
        return;
    }

    spdlog::info("BackgroundSampler: stopping");
    m_Running.store(false);

    if (m_SamplerThread.joinable())
    {
        m_SamplerThread.request_stop();
        m_SamplerThread.join();
    }

    spdlog::debug("BackgroundSampler: stopped");
}

bool BackgroundSampler::isRunning() const
{
    return m_Running.load();
}

void BackgroundSampler::setCallback(SnapshotCallback callback)
{
    std::lock_guard lock(m_CallbackMutex);
    m_Callback = std::move(callback);
}

void BackgroundSampler::requestRefresh()
{
    {
        std::lock_guard lock(m_WakeMutex);
        m_RefreshRequested = true;
    }
    m_WakeCv.notify_all();
}

std::chrono::milliseconds BackgroundSampler::interval() const
{
    std::lock_guard lock(m_WakeMutex);
    return m_Config.interval;
}

void BackgroundSampler::setInterval(std::chrono::milliseconds newInterval)
{
    {
        std::lock_guard lock(m_WakeMutex);
        m_Config.interval = newInterval;
    }
    m_WakeCv.notify_all();
    spdlog::info("BackgroundSampler: interval changed to {}ms", newInterval.count());
}

void BackgroundSampler::samplerLoop(std::stop_token stopToken)
{
    spdlog::debug("BackgroundSampler: thread started");

    while (!stopToken.stop_requested())
    {
        const auto tickStart = std::chrono::steady_clock::now();

        // Clear before sampling so a request made during this tick triggers the next one
        {
            std::lock_guard lock(m_WakeMutex);
            m_RefreshRequested = false;
        }

        publishTick(tickStart);
        waitForNextTick(stopToken, tickStart);
    }

    spdlog::debug("BackgroundSampler: thread exiting");
}

void BackgroundSampler::publishTick(std::chrono::steady_clock::time_point tickStart)
{
    // Failures are recorded by the monitor; the previous connections stay published.
    std::ignore = m_Monitor->refresh(tickStart);
    const auto connections = m_Monitor->connections();
    const std::uint64_t refreshCount = m_Monitor->refreshCount();

    std::lock_guard lock(m_CallbackMutex);
    if (m_Callback)
    {
        m_Callback(connections, refreshCount);
    }
}

void BackgroundSampler::waitForNextTick(const std::stop_token& stopToken, std::chrono::steady_clock::time_point tickStart)
{
    std::unique_lock lock(m_WakeMutex);
    while (!m_RefreshRequested && !stopToken.stop_requested())
    {
        const auto interval = m_Config.interval;
        const auto deadline = tickStart + interval;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return;
        }

        // Wakes on stop, requestRefresh() or setInterval(); the loop re-times against the new interval.
        m_WakeCv.wait_until(lock, stopToken, deadline, [&] { return m_RefreshRequested || m_Config.interval != interval; });
    }
}

} // namespace Domain
