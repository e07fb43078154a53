#pragma once

#include "ConnectionMonitor.h"

#include "Platform/ConnectionTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace Domain
{

/// Configuration for background sampling.
struct SamplerConfig
{
    std::chrono::milliseconds interval{1000}; // 1 second default
};

/// Background sampler that runs ConnectionMonitor::refresh on a separate thread.
/// Publishes each tick's connections via callback, stale ones included when a refresh fails.
class BackgroundSampler
{
  public:
    using SnapshotCallback = std::function<void(const std::vector<Platform::Connection>&, std::uint64_t)>;

    explicit BackgroundSampler(std::shared_ptr<ConnectionMonitor> monitor, SamplerConfig config = {});
    ~BackgroundSampler();

    BackgroundSampler(const BackgroundSampler&) = delete;
    BackgroundSampler& operator=(const BackgroundSampler&) = delete;
    BackgroundSampler(BackgroundSampler&&) = delete;
    BackgroundSampler& operator=(BackgroundSampler&&) = delete;

    /// Start background sampling thread.
    void start();

    /// Stop background sampling thread (waits for completion).
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Set callback for when new data arrives. Called on the sampler thread.
    void setCallback(SnapshotCallback callback);

    /// Wake the sampler for an immediate refresh.
    void requestRefresh();

    [[nodiscard]] std::chrono::milliseconds interval() const;

    /// Set sampling interval. A running wait is re-timed against the new interval.
    void setInterval(std::chrono::milliseconds interval);

  private:
    void samplerLoop(std::stop_token stopToken);
    void publishTick(std::chrono::steady_clock::time_point tickStart);

    /// Block until the interval since @p tickStart has passed, a refresh is requested or stop is requested.
    void waitForNextTick(const std::stop_token& stopToken, std::chrono::steady_clock::time_point tickStart);

    std::shared_ptr<ConnectionMonitor> m_Monitor;
    std::atomic<bool> m_Running{false};

    mutable std::mutex m_CallbackMutex;
    SnapshotCallback m_Callback;

    mutable std::mutex m_WakeMutex; // Guards the interval and the refresh request
    std::condition_variable_any m_WakeCv;
    SamplerConfig m_Config;
    bool m_RefreshRequested = false;

    std::jthread m_SamplerThread;
};

} // namespace Domain
