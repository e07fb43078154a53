/// @file test_BackgroundSampler.cpp
/// @brief Tests for Domain::BackgroundSampler
///
/// Tests cover:
/// - Start/stop lifecycle
/// - Callback invocation with published connections
/// - Interval configuration
/// - Refresh requests
/// - Failed refreshes
/// - Thread safety

#include "Domain/BackgroundSampler.h"
#include "Mocks/MockProbes.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using TestMocks::makeConnection;
using TestMocks::MockProcessIoProbe;
using TestMocks::MockSocketTableReader;

namespace
{

/// Monitor over a scripted reader; @p configure may add tables or failures before it is wrapped.
template<typename Configure> std::shared_ptr<Domain::ConnectionMonitor> makeMonitor(Configure&& configure)
{
    auto reader = std::make_unique<MockSocketTableReader>();
    configure(*reader);
    return std::make_shared<Domain::ConnectionMonitor>(std::move(reader), std::make_unique<MockProcessIoProbe>());
}

std::shared_ptr<Domain::ConnectionMonitor> makeMonitor()
{
    return makeMonitor([](MockSocketTableReader&) {});
}

/// Records callback invocations and lets a test wait for a number of them.
class CallbackRecorder
{
  public:
    Domain::BackgroundSampler::SnapshotCallback callback()
    {
        return [this](const std::vector<Platform::Connection>& connections, std::uint64_t refreshCount)
        {
            std::lock_guard lock(m_Mutex);
            m_LastConnections = connections;
            m_LastRefreshCount = refreshCount;
            ++m_Calls;
            m_Cv.notify_all();
        };
    }

    bool waitForCalls(int count, std::chrono::milliseconds timeout = 5s)
    {
        std::unique_lock lock(m_Mutex);
        return m_Cv.wait_for(lock, timeout, [&] { return m_Calls >= count; });
    }

    [[nodiscard]] int calls() const
    {
        std::lock_guard lock(m_Mutex);
        return m_Calls;
    }

    [[nodiscard]] std::vector<Platform::Connection> lastConnections() const
    {
        std::lock_guard lock(m_Mutex);
        return m_LastConnections;
    }

    [[nodiscard]] std::uint64_t lastRefreshCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_LastRefreshCount;
    }

  private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    int m_Calls = 0;
    std::vector<Platform::Connection> m_LastConnections;
    std::uint64_t m_LastRefreshCount = 0;
};

} // namespace

// =============================================================================
// Construction Tests
// =============================================================================

TEST(BackgroundSamplerTest, ConstructsStopped)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    EXPECT_FALSE(sampler.isRunning());
}

TEST(BackgroundSamplerTest, ConstructWithCustomInterval)
{
    Domain::SamplerConfig config;
    config.interval = 500ms;

    Domain::BackgroundSampler sampler(makeMonitor(), config);

    EXPECT_EQ(sampler.interval(), 500ms);
}

TEST(BackgroundSamplerTest, DefaultIntervalIsOneSecond)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    EXPECT_EQ(sampler.interval(), 1000ms);
}

// =============================================================================
// Start/Stop Lifecycle Tests
// =============================================================================

TEST(BackgroundSamplerTest, StartSetsRunningTrue)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    sampler.start();
    EXPECT_TRUE(sampler.isRunning());

    sampler.stop();
    EXPECT_FALSE(sampler.isRunning());
}

TEST(BackgroundSamplerTest, StopWhenNotRunningIsNoOp)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    sampler.stop();
    EXPECT_FALSE(sampler.isRunning());
}

TEST(BackgroundSamplerTest, DoubleStartIsIgnored)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    sampler.start();
    sampler.start(); // Should be ignored
    EXPECT_TRUE(sampler.isRunning());

    sampler.stop();
}

TEST(BackgroundSamplerTest, DestructorStopsSampler)
{
    {
        Domain::BackgroundSampler sampler(makeMonitor());
        sampler.start();
        EXPECT_TRUE(sampler.isRunning());
    }
    // If we get here without hanging, the test passes
    SUCCEED();
}

// =============================================================================
// Callback Tests
// =============================================================================

TEST(BackgroundSamplerTest, CallbackReceivesConnections)
{
    auto monitor = makeMonitor([](MockSocketTableReader& reader)
                               { reader.withTable(Platform::SocketProtocol::Tcp, {makeConnection("123", "test_process")}); });

    Domain::SamplerConfig config;
    config.interval = 50ms;
    Domain::BackgroundSampler sampler(monitor, config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();

    EXPECT_TRUE(recorder.waitForCalls(1));
    sampler.stop();

    const auto connections = recorder.lastConnections();
    ASSERT_EQ(connections.size(), 1U);
    EXPECT_EQ(connections[0].pid, "123");
    EXPECT_EQ(connections[0].program, "test_process");
    EXPECT_GE(recorder.lastRefreshCount(), 1U);
}

TEST(BackgroundSamplerTest, CallbackInvokedMultipleTimes)
{
    Domain::SamplerConfig config;
    config.interval = 30ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();

    EXPECT_TRUE(recorder.waitForCalls(3));
    sampler.stop();

    EXPECT_GE(recorder.calls(), 3);
}

TEST(BackgroundSamplerTest, FailedRefreshStillPublishesPreviousConnections)
{
    auto monitor = makeMonitor([](MockSocketTableReader& reader) { reader.withAllTablesFailing(); });

    Domain::SamplerConfig config;
    config.interval = 30ms;
    Domain::BackgroundSampler sampler(monitor, config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();

    EXPECT_TRUE(recorder.waitForCalls(2));
    sampler.stop();

    EXPECT_TRUE(recorder.lastConnections().empty());
    EXPECT_EQ(recorder.lastRefreshCount(), 0U);
    EXPECT_TRUE(monitor->lastError().has_value());
}

TEST(BackgroundSamplerTest, NoCallbackSetDoesNotCrash)
{
    auto monitor = makeMonitor();

    Domain::SamplerConfig config;
    config.interval = 20ms;
    Domain::BackgroundSampler sampler(monitor, config);

    sampler.start();
    std::this_thread::sleep_for(100ms);
    sampler.stop();

    EXPECT_GE(monitor->refreshCount(), 1U);
}

// =============================================================================
// Interval Configuration Tests
// =============================================================================

TEST(BackgroundSamplerTest, SetIntervalWhileRunning)
{
    Domain::SamplerConfig config;
    config.interval = 500ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    sampler.start();
    EXPECT_EQ(sampler.interval(), 500ms);

    sampler.setInterval(100ms);
    EXPECT_EQ(sampler.interval(), 100ms);

    sampler.stop();
}

TEST(BackgroundSamplerTest, SetIntervalWhileStopped)
{
    Domain::BackgroundSampler sampler(makeMonitor());

    sampler.setInterval(250ms);
    EXPECT_EQ(sampler.interval(), 250ms);
}

// =============================================================================
// Refresh Request Tests
// =============================================================================

TEST(BackgroundSamplerTest, RequestRefreshTriggersEarlySample)
{
    Domain::SamplerConfig config;
    config.interval = 10000ms; // Long interval
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();

    ASSERT_TRUE(recorder.waitForCalls(1));

    sampler.requestRefresh();
    EXPECT_TRUE(recorder.waitForCalls(2, 2s));

    sampler.stop();
}

TEST(BackgroundSamplerTest, ShorterIntervalCutsRunningWait)
{
    Domain::SamplerConfig config;
    config.interval = 10000ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();
    ASSERT_TRUE(recorder.waitForCalls(1));

    sampler.setInterval(20ms);
    EXPECT_TRUE(recorder.waitForCalls(3, 2s));

    sampler.stop();
}

TEST(BackgroundSamplerTest, StopInterruptsLongWait)
{
    Domain::SamplerConfig config;
    config.interval = 10000ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    CallbackRecorder recorder;
    sampler.setCallback(recorder.callback());
    sampler.start();
    ASSERT_TRUE(recorder.waitForCalls(1));

    const auto stopStart = std::chrono::steady_clock::now();
    sampler.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stopStart, 2s);
    EXPECT_EQ(recorder.calls(), 1);
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST(BackgroundSamplerTest, ConcurrentIntervalChanges)
{
    Domain::SamplerConfig config;
    config.interval = 50ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);
    sampler.start();

    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i)
    {
        threads.emplace_back(
            [&sampler, i]()
            {
                for (int j = 0; j < 20; ++j)
                {
                    sampler.setInterval(std::chrono::milliseconds(50 + (i * 10) + j));
                    std::this_thread::sleep_for(2ms);
                }
            });
    }

    for (auto& t : threads)
    {
        t.join();
    }

    sampler.stop();

    EXPECT_GT(sampler.interval().count(), 0);
}

TEST(BackgroundSamplerTest, ConcurrentCallbackChange)
{
    Domain::SamplerConfig config;
    config.interval = 20ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);

    std::atomic<int> callbackCount{0};
    sampler.start();

    for (int i = 0; i < 10; ++i)
    {
        sampler.setCallback([&](const auto&, std::uint64_t) { callbackCount.fetch_add(1); });
        std::this_thread::sleep_for(20ms);
    }

    sampler.stop();

    EXPECT_GT(callbackCount.load(), 0);
}

TEST(BackgroundSamplerTest, ConcurrentRefreshRequests)
{
    Domain::SamplerConfig config;
    config.interval = 200ms;
    Domain::BackgroundSampler sampler(makeMonitor(), config);
    sampler.setCallback([](const auto&, std::uint64_t) {});
    sampler.start();

    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i)
    {
        threads.emplace_back(
            [&sampler]()
            {
                for (int j = 0; j < 10; ++j)
                {
                    sampler.requestRefresh();
                    std::this_thread::sleep_for(5ms);
                }
            });
    }

    for (auto& t : threads)
    {
        t.join();
    }

    sampler.stop();
    SUCCEED();
}
