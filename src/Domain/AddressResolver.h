#pragma once

#include "Platform/IReverseLookup.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Domain
{

struct ResolverConfig
{
    bool enabled = false;
    std::size_t workers = 4;
    std::size_t maxQueue = 256;
};

/// Turns "ip:port" strings into display names without ever blocking the caller.
///
/// Well-known addresses are classified (ANY, LOCALHOST, MDNS). Anything else is returned raw
/// on first sight while a worker runs a reverse lookup; later calls see "hostname:port".
/// At most one lookup per IP is queued or running at a time.
class AddressResolver
{
  public:
    AddressResolver(std::shared_ptr<Platform::IReverseLookup> lookup, ResolverConfig config);
    ~AddressResolver();

    AddressResolver(const AddressResolver&) = delete;
    AddressResolver& operator=(const AddressResolver&) = delete;
    AddressResolver(AddressResolver&&) = delete;
    AddressResolver& operator=(AddressResolver&&) = delete;

    /// Display string for @p address. Never blocks on a lookup.
    [[nodiscard]] std::string resolveAddress(const std::string& address);

    /// Disabling clears the cache, drops queued requests and cancels running lookups.
    /// A running lookup keeps its IP pending until it returns.
    void setResolveHosts(bool enabled);
    [[nodiscard]] bool resolveHosts() const;

    void clearCache();

    /// IPs with a queued or running lookup.
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t cacheSize() const;
    [[nodiscard]] std::size_t queuedCount() const;

    /// Cancel everything and join the workers. Idempotent; later lookups are not started.
    void shutdown();

    /// "ANY", "LOCALHOST" or "MDNS" for the well-known forms, nullopt otherwise.
    [[nodiscard]] static std::optional<std::string_view> classify(std::string_view address) noexcept;

    struct AddressParts
    {
        std::string ip;   // Brackets stripped
        std::string port; // Empty when there is no ':'
    };

    [[nodiscard]] static AddressParts splitAddress(std::string_view address);

  private:
    struct Request
    {
        std::string address;
        std::string ip;
        std::string port;
        std::uint64_t generation = 0;
        std::stop_token cancelToken;
    };

    void workerLoop(std::stop_token stopToken);
    void complete(const Request& request, std::string display);
    void cancelAllLocked();

    std::shared_ptr<Platform::IReverseLookup> m_Lookup;
    const std::size_t m_MaxQueue;

    mutable std::mutex m_Mutex; // Guards everything below
    std::condition_variable_any m_QueueCv;
    bool m_Enabled = false;
    bool m_ShuttingDown = false;
    std::uint64_t m_Generation = 0;
    std::stop_source m_CancelSource;
    std::unordered_map<std::string, std::string> m_Cache;     // Full address -> display string
    std::unordered_set<std::string> m_Pending;                // IPs queued or being looked up
    std::deque<Request> m_Queue;

    std::vector<std::jthread> m_Workers; // Last member: joined before the state above is destroyed
};

} // namespace Domain
