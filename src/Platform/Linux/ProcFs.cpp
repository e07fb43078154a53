#include "ProcFs.h"

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>

#include <dirent.h>
#include <unistd.h>

namespace Platform::ProcFs
{

namespace
{

constexpr std::string_view SOCKET_LINK_PREFIX = "socket:[";

} // namespace

std::optional<std::int32_t> pidFromDirectoryName(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }

    std::int32_t pid = 0;
    const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc{} || ptr != name.data() + name.size() || pid <= 0)
    {
        return std::nullopt;
    }
    return pid;
}

std::expected<void, ProcReadError> forEachPid(const std::filesystem::path& procRoot,
                                              const std::function<void(std::int32_t, const std::filesystem::path&)>& visitor)
{
    std::error_code errorCode;
    std::filesystem::directory_iterator it(procRoot, errorCode);
    if (errorCode)
    {
        return std::unexpected(ProcReadError{.path = procRoot, .code = errorCode});
    }

    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(errorCode))
    {
        if (errorCode)
        {
            // Entries vanish while we walk; stop here and keep what we have.
            spdlog::debug("Error iterating {}: {}", procRoot.string(), errorCode.message());
            break;
        }

        const auto pid = pidFromDirectoryName(it->path().filename().string());
        if (!pid)
        {
            continue;
        }
        visitor(*pid, it->path());
    }

    return {};
}

std::optional<std::string> readProcessName(const std::filesystem::path& pidDir)
{
    std::ifstream statusFile(pidDir / "status");
    if (!statusFile.is_open())
    {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(statusFile, line))
    {
        if (line.starts_with("Name:"))
        {
            const auto start = line.find_first_not_of(" \t", 5);
            if (start == std::string::npos)
            {
                return std::string{};
            }
            return line.substr(start);
        }
    }
    return std::nullopt;
}

std::optional<std::string> readProcessCommand(const std::filesystem::path& pidDir, std::int32_t pid)
{
    std::ifstream cmdlineFile(pidDir / "cmdline", std::ios::binary);
    if (!cmdlineFile.is_open())
    {
        return std::nullopt;
    }

    std::string raw((std::istreambuf_iterator<char>(cmdlineFile)), std::istreambuf_iterator<char>());
    if (cmdlineFile.bad())
    {
        return std::nullopt;
    }

    while (!raw.empty() && raw.back() == '\0')
    {
        raw.pop_back();
    }

    if (raw.empty())
    {
        return "[" + std::to_string(pid) + "]";
    }

    for (char& c : raw)
    {
        if (c == '\0')
        {
            c = ' ';
        }
    }
    return raw;
}

std::optional<std::uint64_t> socketInodeFromLink(std::string_view target)
{
    if (!target.starts_with(SOCKET_LINK_PREFIX) || !target.ends_with(']'))
    {
        return std::nullopt;
    }

    const auto digits = target.substr(SOCKET_LINK_PREFIX.size(), target.size() - SOCKET_LINK_PREFIX.size() - 1);
    std::uint64_t inode = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), inode);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return inode;
}

std::vector<std::uint64_t> collectSocketInodes(const std::filesystem::path& pidDir)
{
    std::vector<std::uint64_t> inodes;

    const std::filesystem::path fdPath = pidDir / "fd";

    // opendir/readdir avoids the exception overhead of directory_iterator on hot scans
    DIR* fdDir = opendir(fdPath.c_str());
    if (fdDir == nullptr)
    {
        return inodes; // Permission denied or process exited
    }

    std::array<char, 256> linkTarget{};

    // NOLINTNEXTLINE(concurrency-mt-unsafe) - readdir is safe here: single DIR* per thread
    while (const struct dirent* entry = readdir(fdDir))
    {
        if (entry->d_name[0] == '.')
        {
            continue;
        }

        const std::filesystem::path fdFilePath = fdPath / entry->d_name;
        const ssize_t linkLen = readlink(fdFilePath.c_str(), linkTarget.data(), linkTarget.size() - 1);
        if (linkLen <= 0)
        {
            continue; // Owned by another user
        }

        const std::string_view target(linkTarget.data(), static_cast<std::size_t>(linkLen));
        if (auto inode = socketInodeFromLink(target); inode && *inode != 0)
        {
            inodes.push_back(*inode);
        }
    }

    closedir(fdDir);
    return inodes;
}

} // namespace Platform::ProcFs
