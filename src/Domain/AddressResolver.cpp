#include "AddressResolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace Domain
{

namespace
{

constexpr std::string_view LABEL_ANY = "ANY";
constexpr std::string_view LABEL_LOCALHOST = "LOCALHOST";
constexpr std::string_view LABEL_MDNS = "MDNS";

} // namespace

AddressResolver::AddressResolver(std::shared_ptr<Platform::IReverseLookup> lookup, ResolverConfig config)
    : m_Lookup(std::move(lookup)), m_MaxQueue(std::max<std::size_t>(1, config.maxQueue)), m_Enabled(config.enabled)
{
    const std::size_t workerCount = std::max<std::size_t>(1, config.workers);
    m_Workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        m_Workers.emplace_back([this](std::stop_token stopToken) { workerLoop(std::move(stopToken)); });
    }

    spdlog::info("AddressResolver: {} workers, queue limit {}, resolution {}", workerCount, m_MaxQueue, m_Enabled ? "enabled" : "disabled");
}

AddressResolver::~AddressResolver()
{
    shutdown();
}

std::optional<std::string_view> AddressResolver::classify(std::string_view address) noexcept
{
    if (address == "0.0.0.0:*" || address == "*:*" || address == "[::]:*" || address == "0.0.0.0:0" || address == "[::]:0")
    {
        return LABEL_ANY;
    }
    if (address.starts_with("127.0.0.1:") || address.starts_with("[::1]:"))
    {
        return LABEL_LOCALHOST;
    }
    if (address.starts_with("224.0.0.251:"))
    {
        return LABEL_MDNS;
    }
    return std::nullopt;
}

AddressResolver::AddressParts AddressResolver::splitAddress(std::string_view address)
{
    const auto lastColon = address.rfind(':');
    if (lastColon == std::string_view::npos)
    {
        return AddressParts{.ip = std::string(address), .port = {}};
    }

    auto ip = address.substr(0, lastColon);
    if (ip.size() >= 2 && ip.front() == '[' && ip.back() == ']')
    {
        ip = ip.substr(1, ip.size() - 2);
    }
    return AddressParts{.ip = std::string(ip), .port = std::string(address.substr(lastColon + 1))};
}

std::string AddressResolver::resolveAddress(const std::string& address)
{
    if (auto label = classify(address))
    {
        return std::string(*label);
    }

    std::lock_guard lock(m_Mutex);
    if (!m_Enabled || !m_Lookup)
    {
        return address;
    }

    if (auto it = m_Cache.find(address); it != m_Cache.end())
    {
        return it->second;
    }

    if (m_ShuttingDown)
    {
        return address;
    }

    auto parts = splitAddress(address);
    if (m_Pending.contains(parts.ip))
    {
        return address;
    }

    if (m_Queue.size() >= m_MaxQueue)
    {
        // Not admitted; a later call retries once the queue drains.
        spdlog::trace("AddressResolver: queue full, deferring {}", parts.ip);
        return address;
    }

    m_Pending.insert(parts.ip);
    m_Queue.push_back(Request{.address = address,
                              .ip = std::move(parts.ip),
                              .port = std::move(parts.port),
                              .generation = m_Generation,
                              .cancelToken = m_CancelSource.get_token()});
    m_QueueCv.notify_one();

    return address;
}

void AddressResolver::workerLoop(std::stop_token stopToken)
{
    while (!stopToken.stop_requested())
    {
        Request request;
        {
            std::unique_lock lock(m_Mutex);
            if (!m_QueueCv.wait(lock, stopToken, [this] { return !m_Queue.empty(); }))
            {
                return; // Stop requested
            }
            request = std::move(m_Queue.front());
            m_Queue.pop_front();
        }

        // Never hold the lock across the lookup.
        auto hostname = m_Lookup->reverseLookup(request.ip, request.cancelToken);

        if (!hostname && hostname.error().kind == Platform::LookupErrorKind::Cancelled)
        {
            complete(request, {});
            continue;
        }

        std::string display = request.address;
        if (hostname)
        {
            display = request.port.empty() ? *hostname : *hostname + ":" + request.port;
        }
        else
        {
            spdlog::debug("AddressResolver: {} not resolved: {}", request.ip, hostname.error().message);
        }
        complete(request, std::move(display));
    }
}

void AddressResolver::complete(const Request& request, std::string display)
{
    std::lock_guard lock(m_Mutex);

    // Results from before a disable/shutdown, or of a cancelled lookup, are dropped.
    const bool current = request.generation == m_Generation && !request.cancelToken.stop_requested();
    if (current && !display.empty())
    {
        m_Cache.insert_or_assign(request.address, std::move(display));
    }

    // In-flight IPs stay pending across a disable, so this is the only place they leave.
    m_Pending.erase(request.ip);
}

void AddressResolver::cancelAllLocked()
{
    m_CancelSource.request_stop();
    m_CancelSource = std::stop_source{};
    ++m_Generation;

    // Queued requests never reach a worker; lookups already running release their IP in complete().
    for (const auto& request : m_Queue)
    {
        m_Pending.erase(request.ip);
    }
    m_Queue.clear();
}

void AddressResolver::setResolveHosts(bool enabled)
{
    std::lock_guard lock(m_Mutex);
    if (enabled == m_Enabled)
    {
        return;
    }

    m_Enabled = enabled;
    if (!enabled)
    {
        cancelAllLocked();
        m_Cache.clear();
    }
    spdlog::info("AddressResolver: hostname resolution {}", enabled ? "enabled" : "disabled");
}

bool AddressResolver::resolveHosts() const
{
    std::lock_guard lock(m_Mutex);
    return m_Enabled;
}

void AddressResolver::clearCache()
{
    std::lock_guard lock(m_Mutex);
    m_Cache.clear();
}

std::size_t AddressResolver::pendingCount() const
{
    std::lock_guard lock(m_Mutex);
    return m_Pending.size();
}

std::size_t AddressResolver::cacheSize() const
{
    std::lock_guard lock(m_Mutex);
    return m_Cache.size();
}

std::size_t AddressResolver::queuedCount() const
{
    std::lock_guard lock(m_Mutex);
    return m_Queue.size();
}

void AddressResolver::shutdown()
{
    {
        std::lock_guard lock(m_Mutex);
        if (m_ShuttingDown)
        {
            return;
        }
        m_ShuttingDown = true;
        cancelAllLocked();
    }

    for (auto& worker : m_Workers)
    {
        worker.request_stop();
    }
    m_QueueCv.notify_all();

    for (auto& worker : m_Workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    spdlog::debug("AddressResolver: workers stopped");
}

} // namespace Domain
