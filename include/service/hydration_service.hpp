#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "cryptography/event_verifier.hpp"
#include "data/data.hpp"
#include "service/event_projector.hpp"
#include "service/query_aggregator.hpp"
#include "service/relay_pool.hpp"
#include "service/subscription_worker.hpp"
#include "store/record_store.hpp"

namespace hydrator
{
namespace service
{
struct HydrationOptions
{
    std::chrono::milliseconds perRelayTimeout = std::chrono::seconds(15);
    std::chrono::milliseconds overallTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds receiveTimeout = std::chrono::seconds(5);
    std::chrono::milliseconds backoff = std::chrono::seconds(5);
};

/**
 * @brief The outcome of a bulk backfill.
 */
struct HydrationSummary
{
    int fetched = 0; ///< Verified, distinct events returned by the relays.
    int saved = 0; ///< Events projected into new records.
    int skipped = 0; ///< Events that had already been projected.
    int errors = 0; ///< Events that could not be projected.
    int rejected = 0; ///< Events dropped by the relays' legs because they failed verification.
    std::vector<std::string> relaysReached;
    std::vector<std::string> relaysFailed;
};

/**
 * @brief The outcome of a live subscription, once it has been stopped.
 */
struct SubscriptionSummary
{
    int delivered = 0;
    int saved = 0;
    int skipped = 0;
    int errors = 0;
    int rejected = 0;
    int reconnects = 0;
};

/**
 * @brief Pulls events from relays and projects them into the record store.
 */
class HydrationService
{
public:
    HydrationService(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<RelayPool> pool,
        std::shared_ptr<cryptography::IEventVerifier> verifier,
        std::shared_ptr<store::IRecordStore> store,
        HydrationOptions options = HydrationOptions());

    /**
     * @brief Fetches every event matching the filters from the given relays and projects it.
     * @param relayUrls The relays to query.  The pool's default relays are used if empty.  The
     * local relay is always included.
     * @param batchSize The number of projected events committed together.
     * @throws `std::invalid_argument` if the filters are invalid or `batchSize` is zero.
     * @remark Individual relay outages and bad events are counted in the summary, never thrown.
     */
    HydrationSummary backfill(
        const std::vector<std::string>& relayUrls,
        const std::vector<data::Filters>& filters,
        size_t batchSize);

    /**
     * @brief Projects every event matching the filters as it is published to the given relay,
     * until the token is cancelled.
     * @param relayUrl The relay to subscribe to.  The local relay, or else the first default
     * relay, is used if empty.
     */
    SubscriptionSummary subscribe(
        const std::string& relayUrl,
        const std::vector<data::Filters>& filters,
        CancellationToken& cancellationToken);

    /**
     * @brief Gets the projector shared by backfills and subscriptions.
     */
    std::shared_ptr<EventProjector> projector() const;

private:
    std::shared_ptr<plog::IAppender> _appender;
    std::shared_ptr<RelayPool> _pool;
    std::shared_ptr<cryptography::IEventVerifier> _verifier;
    std::shared_ptr<store::IRecordStore> _store;
    std::shared_ptr<QueryAggregator> _aggregator;
    std::shared_ptr<EventProjector> _projector;
    HydrationOptions _options;
};
} // namespace service
} // namespace hydrator
