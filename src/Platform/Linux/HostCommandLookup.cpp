#include "HostCommandLookup.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Platform
{

namespace
{

constexpr int EXIT_EXEC_FAILED = 127;
constexpr int POLL_SLICE_MS = 100;
constexpr std::chrono::milliseconds EXIT_POLL_SLICE{10};
constexpr std::size_t MAX_OUTPUT_BYTES = 64 * 1024;

/// Closes the descriptor on scope exit.
class ScopedFd
{
  public:
    explicit ScopedFd(int fd = -1) noexcept : m_Fd(fd)
    {
    }
    ~ScopedFd()
    {
        reset();
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
    ScopedFd(ScopedFd&& other) noexcept : m_Fd(std::exchange(other.m_Fd, -1))
    {
    }
    ScopedFd& operator=(ScopedFd&& other) noexcept
    {
        if (this != &other)
        {
            reset(std::exchange(other.m_Fd, -1));
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_Fd;
    }

    void reset(int fd = -1) noexcept
    {
        if (m_Fd >= 0)
        {
            ::close(m_Fd);
        }
        m_Fd = fd;
    }

  private:
    int m_Fd;
};

/// Blocking waitpid that retries on EINTR. Returns the raw status, or nullopt on failure.
[[nodiscard]] std::optional<int> reapChild(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            spdlog::warn("waitpid({}) failed: {}", pid, strerror(errno));
            return std::nullopt;
        }
    }
    return status;
}

void killAndReap(pid_t pid)
{
    ::kill(pid, SIGKILL);
    std::ignore = reapChild(pid);
}

[[nodiscard]] std::vector<std::string_view> splitWords(std::string_view line)
{
    std::vector<std::string_view> words;
    std::size_t pos = 0;
    while (pos < line.size())
    {
        const auto start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos)
        {
            break;
        }
        auto end = line.find_first_of(" \t\r", start);
        if (end == std::string_view::npos)
        {
            end = line.size();
        }
        words.push_back(line.substr(start, end - start));
        pos = end;
    }
    return words;
}

} // namespace

HostCommandLookup::HostCommandLookup(HostCommandConfig config) : m_Config(std::move(config))
{
}

bool HostCommandLookup::isIpAddressText(const std::string& ip)
{
    std::array<unsigned char, sizeof(in6_addr)> buffer{};
    return ::inet_pton(AF_INET, ip.c_str(), buffer.data()) == 1 || ::inet_pton(AF_INET6, ip.c_str(), buffer.data()) == 1;
}

std::optional<std::string> HostCommandLookup::parseHostOutput(std::string_view output)
{
    std::size_t lineStart = 0;
    while (lineStart < output.size())
    {
        auto lineEnd = output.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
        {
            lineEnd = output.size();
        }
        const auto line = output.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;

        if (line.find("domain name pointer") == std::string_view::npos && line.find("is an alias for") == std::string_view::npos)
        {
            continue;
        }

        const auto words = splitWords(line);
        for (std::size_t i = 0; i + 1 < words.size(); ++i)
        {
            if (words[i] != "pointer" && words[i] != "alias")
            {
                continue;
            }

            // "X is an alias for Y." names the canonical target Y
            std::size_t nameIndex = i + 1;
            if (words[i] == "alias" && words[nameIndex] == "for")
            {
                ++nameIndex;
            }
            if (nameIndex >= words.size())
            {
                continue;
            }

            auto hostname = words[nameIndex];
            while (hostname.ends_with('.'))
            {
                hostname.remove_suffix(1);
            }
            if (!hostname.empty())
            {
                return std::string(hostname);
            }
        }
    }
    return std::nullopt;
}

std::expected<std::string, LookupError> HostCommandLookup::reverseLookup(const std::string& ip, std::stop_token stopToken)
{
    // Also keeps option-looking strings ("-x") away from the command line.
    if (!isIpAddressText(ip))
    {
        return std::unexpected(LookupError{.kind = LookupErrorKind::InvalidAddress, .message = "not an IP address: " + ip});
    }
    if (stopToken.stop_requested())
    {
        return std::unexpected(LookupError{.kind = LookupErrorKind::Cancelled, .message = "cancelled before start"});
    }

    std::array<int, 2> pipeFds{-1, -1};
    if (::pipe2(pipeFds.data(), O_CLOEXEC) == -1)
    {
        return std::unexpected(LookupError{.kind = LookupErrorKind::SpawnFailed, .message = std::string("pipe2: ") + strerror(errno)});
    }
    ScopedFd readEnd(pipeFds[0]);
    ScopedFd writeEnd(pipeFds[1]);

    const pid_t child = ::fork();
    if (child == -1)
    {
        return std::unexpected(LookupError{.kind = LookupErrorKind::SpawnFailed, .message = std::string("fork: ") + strerror(errno)});
    }

    if (child == 0)
    {
        // Child: only async-signal-safe calls until exec.
        ::dup2(writeEnd.get(), STDOUT_FILENO);
        const int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0)
        {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        ::execlp(m_Config.command.c_str(), m_Config.command.c_str(), ip.c_str(), nullptr);
        ::_exit(EXIT_EXEC_FAILED);
    }

    writeEnd.reset();

    const auto deadline = std::chrono::steady_clock::now() + m_Config.timeout;
    std::string output;
    std::array<char, 4096> buffer{};

    while (true)
    {
        if (stopToken.stop_requested())
        {
            killAndReap(child);
            return std::unexpected(LookupError{.kind = LookupErrorKind::Cancelled, .message = "cancelled"});
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            killAndReap(child);
            spdlog::debug("Reverse lookup of {} timed out after {}ms", ip, m_Config.timeout.count());
            return std::unexpected(LookupError{.kind = LookupErrorKind::TimedOut, .message = "timed out"});
        }

        pollfd pfd{.fd = readEnd.get(), .events = POLLIN, .revents = 0};
        const int ready = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (ready == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            killAndReap(child);
            return std::unexpected(LookupError{.kind = LookupErrorKind::SpawnFailed, .message = std::string("poll: ") + strerror(errno)});
        }
        if (ready == 0)
        {
            continue;
        }

        const ssize_t bytesRead = ::read(readEnd.get(), buffer.data(), buffer.size());
        if (bytesRead > 0)
        {
            if (output.size() < MAX_OUTPUT_BYTES)
            {
                output.append(buffer.data(), static_cast<std::size_t>(bytesRead));
            }
            continue;
        }
        if (bytesRead == -1 && errno == EINTR)
        {
            continue;
        }
        break; // EOF or read error
    }

    // EOF only means stdout closed; the command may still be running.
    std::optional<int> status;
    while (true)
    {
        int rawStatus = 0;
        const pid_t reaped = ::waitpid(child, &rawStatus, WNOHANG);
        if (reaped == child)
        {
            status = rawStatus;
            break;
        }
        if (reaped == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::warn("waitpid({}) failed: {}", child, strerror(errno));
            break;
        }

        if (stopToken.stop_requested())
        {
            killAndReap(child);
            return std::unexpected(LookupError{.kind = LookupErrorKind::Cancelled, .message = "cancelled"});
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            killAndReap(child);
            spdlog::debug("Reverse lookup of {} timed out after {}ms waiting for exit", ip, m_Config.timeout.count());
            return std::unexpected(LookupError{.kind = LookupErrorKind::TimedOut, .message = "timed out"});
        }
        std::this_thread::sleep_for(EXIT_POLL_SLICE);
    }

    if (status && WIFEXITED(*status) && WEXITSTATUS(*status) == EXIT_EXEC_FAILED)
    {
        return std::unexpected(
            LookupError{.kind = LookupErrorKind::CommandUnavailable, .message = "cannot run '" + m_Config.command + "'"});
    }

    if (auto hostname = parseHostOutput(output))
    {
        return std::move(*hostname);
    }
    return std::unexpected(LookupError{.kind = LookupErrorKind::NoRecord, .message = "no PTR record for " + ip});
}

} // namespace Platform
