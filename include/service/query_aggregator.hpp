#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <plog/Log.h>

#include "cryptography/event_verifier.hpp"
#include "data/data.hpp"
#include "service/relay_pool.hpp"

namespace hydrator
{
namespace service
{
/**
 * @brief The merged outcome of a fan-out query.
 */
struct QueryResult
{
    std::vector<data::Event> events; ///< Verified events, unique by ID, in relay order.
    std::vector<std::string> eventRelays; ///< The relay each event was first received from.
    std::vector<std::string> succeededRelays;
    std::vector<std::string> failedRelays;
    int rejected = 0; ///< Events dropped because they failed verification.
};

/**
 * @brief Sends one query to many relays at once and merges what they return.
 */
class QueryAggregator
{
public:
    QueryAggregator(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<RelayPool> pool,
        std::shared_ptr<cryptography::IEventVerifier> verifier);

    /**
     * @brief Queries the given relays concurrently and merges their results.
     * @param relayUrls The relays to query.  Duplicates are queried once.
     * @param filters The filters sent in a single REQ to every relay.
     * @param perRelayTimeout The longest any single relay may take to reach EOSE.
     * @param overallTimeout The longest the whole query may take.  Relays still responding at
     * this deadline are abandoned and counted as failed.
     * @returns The verified events of every relay that answered, deduplicated by ID with the
     * first occurrence kept.
     * @throws `std::invalid_argument` if the filters are empty or invalid, or if any filter has no
     * positive `limit`.
     * @remark A relay that cannot be reached never fails the query; it is listed in
     * `failedRelays` instead.
     */
    QueryResult query(
        const std::vector<std::string>& relayUrls,
        const std::vector<data::Filters>& filters,
        std::chrono::milliseconds perRelayTimeout,
        std::chrono::milliseconds overallTimeout);

    /**
     * @brief Publishes a signed event to the given relays.
     * @returns A tuple of relays that accepted the event and relays that rejected it, failed, or
     * did not answer within `timeout`.
     */
    std::tuple<std::vector<std::string>, std::vector<std::string>> publish(
        const std::vector<std::string>& relayUrls,
        const data::Event& event,
        std::chrono::milliseconds timeout);

    /**
     * @brief Gets the number of events rejected by verification across every query so far.
     */
    int rejectedEvents() const;

private:
    struct LegResult
    {
        std::vector<data::Event> events;
        bool succeeded = false;
        int rejected = 0;
    };

    std::shared_ptr<RelayPool> _pool;
    std::shared_ptr<cryptography::IEventVerifier> _verifier;
    std::atomic<int> _rejectedEvents{ 0 };

    /**
     * @brief Runs the query against a single relay until EOSE, CLOSED, or the deadline.
     * @remark Static so that an abandoned leg holds only what it needs, never the aggregator.
     */
    static LegResult _runLeg(
        std::shared_ptr<RelayPool> pool,
        std::shared_ptr<cryptography::IEventVerifier> verifier,
        std::string relayUrl,
        std::vector<data::Filters> filters,
        std::chrono::steady_clock::time_point deadline);

    static bool _publishTo(
        std::shared_ptr<RelayPool> pool,
        std::string relayUrl,
        data::Event event,
        std::chrono::milliseconds timeout);
};
} // namespace service
} // namespace hydrator
