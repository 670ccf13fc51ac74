#include <stdexcept>

#include "service/hydration_service.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace hydrator::store;
using namespace std;

HydrationService::HydrationService(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<RelayPool> pool,
    shared_ptr<IEventVerifier> verifier,
    shared_ptr<IRecordStore> store,
    HydrationOptions options)
{
    hydrator::internal::initLogging(appender);

    this->_appender = appender;
    this->_pool = pool;
    this->_verifier = verifier;
    this->_store = store;
    this->_options = options;
    this->_aggregator = make_shared<QueryAggregator>(appender, pool, verifier);
    this->_projector = make_shared<EventProjector>(appender, store, verifier);
};

HydrationSummary HydrationService::backfill(
    const vector<string>& relayUrls,
    const vector<Filters>& filters,
    size_t batchSize)
{
    if (batchSize == 0)
    {
        throw invalid_argument("HydrationService::backfill: The batch size must be positive.");
    }

    vector<string> relays = relayUrls.empty()
        ? this->_pool->defaultRelays()
        : this->_pool->ensureLocalRelayInList(relayUrls);

    PLOG_INFO << "Backfilling from " << relays.size() << " relays.";
    QueryResult result = this->_aggregator->query(
        relays,
        filters,
        this->_options.perRelayTimeout,
        this->_options.overallTimeout);

    HydrationSummary summary;
    summary.fetched = static_cast<int>(result.events.size());
    summary.rejected = result.rejected;
    summary.relaysReached = result.succeededRelays;
    summary.relaysFailed = result.failedRelays;

    size_t pending = 0;
    this->_store->beginBatch();
    for (size_t i = 0; i < result.events.size(); i++)
    {
        const Event& event = result.events[i];
        try
        {
            Projection projection = this->_projector->project(event, result.eventRelays[i]);
            if (projection.created)
            {
                summary.saved++;
            }
            else
            {
                summary.skipped++;
            }
        }
        catch (const InvalidEventError& ie)
        {
            summary.errors++;
            PLOG_WARNING << "Skipping event " << event.id << ": " << ie.what();
        }
        catch (const StoreError& se)
        {
            summary.errors++;
            PLOG_ERROR << "Failed to store event " << event.id << ": " << se.what();
        }

        if (++pending >= batchSize)
        {
            this->_store->flush();
            this->_store->beginBatch();
            pending = 0;
        }
    }
    this->_store->flush();

    PLOG_INFO << "Backfill complete: " << summary.fetched << " fetched, " << summary.saved << " saved, "
              << summary.skipped << " skipped, " << summary.errors << " errors, " << summary.rejected << " rejected.";
    return summary;
};

SubscriptionSummary HydrationService::subscribe(
    const string& relayUrl,
    const vector<Filters>& filters,
    CancellationToken& cancellationToken)
{
    string relay = relayUrl;
    if (relay.empty())
    {
        relay = this->_pool->localRelay();
    }
    if (relay.empty() && !this->_pool->defaultRelays().empty())
    {
        relay = this->_pool->defaultRelays().front();
    }
    if (relay.empty())
    {
        throw ConfigError("HydrationService::subscribe: No relay is configured.");
    }

    SubscriptionSummary summary;
    SubscriptionWorker worker(
        this->_appender,
        this->_pool,
        this->_verifier,
        this->_options.receiveTimeout,
        this->_options.backoff);

    // Errors other than invalid events propagate to the worker, which logs them and carries on.
    worker.run(relay, filters, [this, &summary](const Event& event, const string& sourceRelay)
    {
        try
        {
            Projection projection = this->_projector->project(event, sourceRelay);
            if (projection.created)
            {
                summary.saved++;
            }
            else
            {
                summary.skipped++;
            }
        }
        catch (const InvalidEventError& ie)
        {
            summary.errors++;
            PLOG_WARNING << "Skipping event " << event.id << " from relay " << sourceRelay << ": " << ie.what();
        }
        catch (const StoreError&)
        {
            summary.errors++;
            throw;
        }
    }, cancellationToken);

    summary.delivered = worker.delivered();
    summary.rejected = worker.rejected();
    summary.reconnects = worker.reconnects();
    return summary;
};

shared_ptr<EventProjector> HydrationService::projector() const
{
    return this->_projector;
};
