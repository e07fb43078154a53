// Benchmarks for socket ownership lookups
//
// Compares a full cache rebuild against the direct fallback scan that runs on a cache miss,
// over a fake /proc tree with a configurable number of processes.

#include "Mocks/FakeProcFs.h"
#include "Platform/Linux/LinuxProcessCorrelator.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

namespace
{

constexpr std::uint64_t SOCKETS_PER_PROCESS = 4;
constexpr std::uint64_t FIRST_INODE = 100000;

/// Tree with @p processes processes, each owning SOCKETS_PER_PROCESS sockets.
void populate(TestMocks::FakeProcFs& proc, int processes)
{
    std::uint64_t inode = FIRST_INODE;
    for (int i = 0; i < processes; ++i)
    {
        std::vector<std::uint64_t> inodes;
        for (std::uint64_t s = 0; s < SOCKETS_PER_PROCESS; ++s)
        {
            inodes.push_back(inode++);
        }
        const auto pid = 1000 + i;
        proc.addProcess(pid, "worker" + std::to_string(i), {"/usr/bin/worker", "--id", std::to_string(i)}, inodes);
    }
}

// Benchmark rebuild() - runs once per cache interval
static void BM_Correlator_Rebuild(benchmark::State& state)
{
    TestMocks::FakeProcFs proc;
    populate(proc, static_cast<int>(state.range(0)));
    Platform::LinuxProcessCorrelator correlator(proc.root(), std::chrono::milliseconds(5000));

    for (auto _ : state)
    {
        correlator.rebuild();
        benchmark::DoNotOptimize(correlator.cachedInodeCount());
    }
}
BENCHMARK(BM_Correlator_Rebuild)->Arg(50)->Arg(200)->Arg(800)->Unit(benchmark::kMillisecond);

// Benchmark a cache hit - the common case between rebuilds
static void BM_Correlator_CachedLookup(benchmark::State& state)
{
    TestMocks::FakeProcFs proc;
    populate(proc, static_cast<int>(state.range(0)));
    Platform::LinuxProcessCorrelator correlator(proc.root(), std::chrono::hours(1));
    correlator.rebuild();

    for (auto _ : state)
    {
        auto identity = correlator.processInfo(FIRST_INODE + 1);
        benchmark::DoNotOptimize(identity);
    }
}
BENCHMARK(BM_Correlator_CachedLookup)->Arg(200);

// Benchmark a cache miss - socket created after the last rebuild, forcing a direct scan
static void BM_Correlator_FallbackScan(benchmark::State& state)
{
    TestMocks::FakeProcFs proc;
    const auto processes = static_cast<int>(state.range(0));
    populate(proc, processes);
    Platform::LinuxProcessCorrelator correlator(proc.root(), std::chrono::hours(1));
    correlator.rebuild();

    // Added after the rebuild, so every lookup misses the cache
    const std::uint64_t lateInode = FIRST_INODE + (SOCKETS_PER_PROCESS * static_cast<std::uint64_t>(processes)) + 1;
    proc.addSocket(1000 + processes - 1, lateInode);

    for (auto _ : state)
    {
        auto identity = correlator.processInfo(lateInode);
        benchmark::DoNotOptimize(identity);
    }
    state.counters["fallback_scans"] = static_cast<double>(correlator.fallbackScanCount());
}
BENCHMARK(BM_Correlator_FallbackScan)->Arg(50)->Arg(200)->Arg(800)->Unit(benchmark::kMillisecond);

} // namespace
