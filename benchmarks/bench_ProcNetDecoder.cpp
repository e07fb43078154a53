// Benchmarks for the /proc/net socket table decoders
//
// Every refresh decodes every line of four tables, so per-line cost scales with the number of
// sockets on the host (thousands on a busy server).

#include "Platform/Linux/LinuxSocketTableReader.h"
#include "Platform/Linux/ProcNetDecoder.h"

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

namespace
{

constexpr const char* TABLE_HEADER = "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode";

std::string makeLine(int slot, std::mt19937& rng)
{
    std::uniform_int_distribution<std::uint32_t> word;
    std::uniform_int_distribution<int> port(1, 65535);
    std::uniform_int_distribution<int> state(1, 11);

    char buffer[160];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%4d: %08X:%04X %08X:%04X %02X 00000000:00000000 00:00000000 00000000  1000        0 %u 1 0000000000000000 20 0 0 10 0",
                  slot,
                  word(rng),
                  port(rng),
                  word(rng),
                  port(rng),
                  state(rng),
                  word(rng));
    return buffer;
}

std::string makeTable(int lines)
{
    std::mt19937 rng(42);
    std::string contents = std::string(TABLE_HEADER) + "\n";
    for (int i = 0; i < lines; ++i)
    {
        contents += makeLine(i, rng) + "\n";
    }
    return contents;
}

// Benchmark parseSocketLine() - one call per socket per refresh
static void BM_ProcNet_ParseSocketLine(benchmark::State& state)
{
    std::mt19937 rng(42);
    std::vector<std::string> lines;
    for (int i = 0; i < 256; ++i)
    {
        lines.push_back(makeLine(i, rng));
    }

    std::size_t index = 0;
    for (auto _ : state)
    {
        auto parsed = Platform::ProcNet::parseSocketLine(lines[index++ % lines.size()]);
        benchmark::DoNotOptimize(parsed);
    }
}
BENCHMARK(BM_ProcNet_ParseSocketLine);

// Benchmark decodeSocketAddress() for both families
static void BM_ProcNet_DecodeIpv4Address(benchmark::State& state)
{
    for (auto _ : state)
    {
        auto address = Platform::ProcNet::decodeSocketAddress("0100007F:1F90");
        benchmark::DoNotOptimize(address);
    }
}
BENCHMARK(BM_ProcNet_DecodeIpv4Address);

static void BM_ProcNet_DecodeIpv6Address(benchmark::State& state)
{
    for (auto _ : state)
    {
        auto address = Platform::ProcNet::decodeSocketAddress("B80D0120000000000000000001000000:01BB");
        benchmark::DoNotOptimize(address);
    }
}
BENCHMARK(BM_ProcNet_DecodeIpv6Address);

// Benchmark a whole table without process attribution
static void BM_ProcNet_ParseTable(benchmark::State& state)
{
    const auto contents = makeTable(static_cast<int>(state.range(0)));
    Platform::LinuxSocketTableReader reader(nullptr);

    for (auto _ : state)
    {
        auto connections = reader.parseTable(Platform::SocketProtocol::Tcp, contents);
        benchmark::DoNotOptimize(connections.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ProcNet_ParseTable)->Arg(100)->Arg(1000)->Arg(10000);

} // namespace
