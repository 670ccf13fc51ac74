#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "service/relay_connection.hpp"

namespace hydrator
{
namespace service
{
/**
 * @brief A snapshot of one relay tracked by the pool.
 */
struct RelayStats
{
    std::string url;
    int failedAttempts = 0; ///< Consecutive failures since the last successful connection.
    std::time_t lastConnected = 0; ///< Unix timestamp of the last traffic, or 0 if never connected.
    long long age = -1; ///< Seconds since `lastConnected`, or -1 if never connected.
    bool connected = false;
};

/**
 * @brief A snapshot of the whole pool.
 */
struct PoolStats
{
    size_t activeConnections = 0;
    std::vector<RelayStats> relays;
};

/**
 * @brief Caches at most one live connection per relay URL and tracks relay health.
 * @remark All access to the relay map goes through the pool and is guarded by a single mutex.
 * Connecting happens outside the lock, so a slow relay does not hold up callers asking for other
 * relays.  The pool runs no background threads; `cleanupStale` is meant to be invoked by a
 * periodic task owned by the caller.
 */
class RelayPool
{
public:
    typedef std::function<std::shared_ptr<IRelayConnection>(const std::string& url)> ConnectionFactory;
    typedef std::function<std::chrono::system_clock::time_point()> Clock;

    /**
     * @brief Relays used when no relay is configured.
     */
    static const std::vector<std::string> publicRelays;

    /**
     * @param appender The plog appender used for log output.
     * @param connectionFactory Creates an unopened connection for the given URL.
     * @param configuredRelays Relays queried by default, after the local relay.
     * @param localRelay The URL of the local relay, which takes priority over every other relay.
     * May be empty.
     * @param clock The source of the current time.
     */
    RelayPool(
        std::shared_ptr<plog::IAppender> appender,
        ConnectionFactory connectionFactory,
        std::vector<std::string> configuredRelays = {},
        std::string localRelay = "",
        Clock clock = std::chrono::system_clock::now);

    /**
     * @brief Gets a live connection to the given relay, opening one if needed.
     * @returns The cached connection if it is still open, otherwise a newly connected one.
     * @throws `ConnectionError` if a new connection cannot be opened.  The relay's failure count
     * is incremented and no retry is attempted.
     */
    std::shared_ptr<IRelayConnection> getConnection(const std::string& url);

    /**
     * @brief Records successful traffic with the given relay.
     */
    void markActive(const std::string& url);

    /**
     * @brief Records a failure on an established connection to the given relay.
     */
    void reportFailure(const std::string& url);

    /**
     * @brief Closes and forgets every connection whose last traffic is more than `maxAge` ago.
     * @returns The number of connections removed.
     */
    int cleanupStale(std::chrono::seconds maxAge);

    /**
     * @brief Closes and forgets the connection to the given relay, if any.
     */
    void closeRelay(const std::string& url);

    /**
     * @brief Closes and forgets every connection.
     */
    void closeAll();

    PoolStats stats() const;

    /**
     * @brief Gets the relays to query when the caller names none.
     * @returns The local relay first, then the configured relays, or the public relays when none
     * are configured.  Duplicates are removed.
     */
    std::vector<std::string> defaultRelays() const;

    /**
     * @brief Gets the normalized URL of the local relay, or an empty string if none is set.
     */
    std::string localRelay() const;

    /**
     * @brief Prepends the local relay to the given list unless it is already present.
     */
    std::vector<std::string> ensureLocalRelayInList(std::vector<std::string> urls) const;

    /**
     * @brief Trims whitespace and trailing slashes so that equivalent URLs share a pool entry.
     */
    static std::string normalizeUrl(const std::string& url);

private:
    struct Relay
    {
        std::shared_ptr<IRelayConnection> connection;
        int failedAttempts = 0;
        std::optional<std::chrono::system_clock::time_point> lastConnected;
    };

    ConnectionFactory _connectionFactory;
    Clock _clock;
    std::vector<std::string> _defaultRelays;
    std::string _localRelay;

    mutable std::mutex _poolMutex;
    std::map<std::string, Relay> _relays;

    /**
     * @brief Gets the time of the last traffic with the relay, as seen by the pool or its
     * connection, whichever is later.
     */
    std::optional<std::chrono::system_clock::time_point> _lastTraffic(const Relay& relay) const;
};
} // namespace service
} // namespace hydrator
