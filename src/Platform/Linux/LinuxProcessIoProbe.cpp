#include "LinuxProcessIoProbe.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace Platform
{

namespace
{

/// Parse "key: value" into value when the line starts with @p key.
bool readCounter(std::string_view line, std::string_view key, std::uint64_t& out)
{
    if (!line.starts_with(key))
    {
        return false;
    }

    auto value = line.substr(key.size());
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos)
    {
        return false;
    }
    value.remove_prefix(first);

    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{})
    {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

LinuxProcessIoProbe::LinuxProcessIoProbe(std::filesystem::path procRoot) : m_ProcRoot(std::move(procRoot))
{
}

ProcessIoCounters LinuxProcessIoProbe::readProcessIo(std::int32_t pid)
{
    ProcessIoCounters counters;
    if (pid <= 0)
    {
        return counters;
    }

    // Only readable for our own processes unless we have CAP_SYS_PTRACE.
    std::ifstream ioFile(m_ProcRoot / std::to_string(pid) / "io");
    if (!ioFile.is_open())
    {
        spdlog::trace("No io accounting for pid {}", pid);
        return counters;
    }

    std::string line;
    while (std::getline(ioFile, line))
    {
        if (readCounter(line, "rchar:", counters.rx))
        {
            continue;
        }
        readCounter(line, "wchar:", counters.tx);
    }

    return counters;
}

} // namespace Platform
