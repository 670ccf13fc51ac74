#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include "service/query_aggregator.hpp"
#include "data/message.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace std;

QueryAggregator::QueryAggregator(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<RelayPool> pool,
    shared_ptr<IEventVerifier> verifier)
{
    hydrator::internal::initLogging(appender);

    this->_pool = pool;
    this->_verifier = verifier;
};

QueryResult QueryAggregator::query(
    const vector<string>& relayUrls,
    const vector<Filters>& filters,
    chrono::milliseconds perRelayTimeout,
    chrono::milliseconds overallTimeout)
{
    if (filters.empty())
    {
        throw invalid_argument("QueryAggregator::query: At least one filter is required.");
    }
    for (const auto& filter : filters)
    {
        filter.validate();
        if (filter.limit <= 0)
        {
            throw invalid_argument("QueryAggregator::query: Every filter must set a positive limit.");
        }
    }

    vector<string> relays;
    for (const auto& url : relayUrls)
    {
        string relayUrl = RelayPool::normalizeUrl(url);
        if (!relayUrl.empty() && find(relays.begin(), relays.end(), relayUrl) == relays.end())
        {
            relays.push_back(relayUrl);
        }
    }

    auto start = chrono::steady_clock::now();
    auto overallDeadline = start + overallTimeout;
    auto legDeadline = min(start + perRelayTimeout, overallDeadline);

    // Legs run on detached threads so that an abandoned leg never blocks the caller.
    vector<future<LegResult>> legs;
    for (const auto& relayUrl : relays)
    {
        auto leg = make_shared<promise<LegResult>>();
        legs.push_back(leg->get_future());

        thread([leg, pool = this->_pool, verifier = this->_verifier, relayUrl, filters, legDeadline]()
        {
            leg->set_value(_runLeg(pool, verifier, relayUrl, filters, legDeadline));
        }).detach();
    }

    QueryResult result;
    unordered_set<string> seenIds;
    for (size_t i = 0; i < relays.size(); i++)
    {
        if (legs[i].wait_until(overallDeadline) != future_status::ready)
        {
            PLOG_WARNING << "Abandoning query to relay " << relays[i] << ": overall timeout reached.";
            result.failedRelays.push_back(relays[i]);
            continue;
        }

        LegResult leg = legs[i].get();
        result.rejected += leg.rejected;
        if (leg.succeeded)
        {
            result.succeededRelays.push_back(relays[i]);
        }
        else
        {
            result.failedRelays.push_back(relays[i]);
        }

        for (auto& event : leg.events)
        {
            if (seenIds.insert(event.id).second)
            {
                result.events.push_back(move(event));
                result.eventRelays.push_back(relays[i]);
            }
        }
    }

    this->_rejectedEvents += result.rejected;

    PLOG_INFO << "Query returned " << result.events.size() << " events from "
              << result.succeededRelays.size() << "/" << relays.size() << " relays ("
              << result.rejected << " rejected).";
    return result;
};

tuple<vector<string>, vector<string>> QueryAggregator::publish(
    const vector<string>& relayUrls,
    const Event& event,
    chrono::milliseconds timeout)
{
    vector<string> successes;
    vector<string> failures;

    vector<tuple<string, future<bool>>> attempts;
    for (const auto& url : relayUrls)
    {
        string relayUrl = RelayPool::normalizeUrl(url);
        attempts.emplace_back(relayUrl, async(launch::async, _publishTo, this->_pool, relayUrl, event, timeout));
    }

    for (auto& [relayUrl, accepted] : attempts)
    {
        if (accepted.get())
        {
            successes.push_back(relayUrl);
        }
        else
        {
            failures.push_back(relayUrl);
        }
    }

    PLOG_INFO << "Published event " << event.id << " to " << successes.size() << "/" << relayUrls.size() << " relays.";
    return make_tuple(successes, failures);
};

int QueryAggregator::rejectedEvents() const
{
    return this->_rejectedEvents;
};

QueryAggregator::LegResult QueryAggregator::_runLeg(
    shared_ptr<RelayPool> pool,
    shared_ptr<IEventVerifier> verifier,
    string relayUrl,
    vector<Filters> filters,
    chrono::steady_clock::time_point deadline)
{
    LegResult leg;
    shared_ptr<IRelayConnection> connection;
    string subscriptionId = generateSubscriptionId();

    try
    {
        connection = pool->getConnection(relayUrl);
        connection->openSubscription(subscriptionId);
        connection->send(serializeRequest(subscriptionId, filters));
    }
    catch (const ConnectionError& ce)
    {
        PLOG_WARNING << "Skipping relay " << relayUrl << ": " << ce.what();
        if (connection != nullptr)
        {
            connection->closeSubscription(subscriptionId);
        }
        return leg;
    }

    PLOG_DEBUG << "Sent REQ " << subscriptionId << " to relay " << relayUrl;

    bool finished = false;
    try
    {
        while (!finished)
        {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                break;
            }

            optional<Frame> frame = connection->receive(subscriptionId, remaining);
            if (!frame.has_value())
            {
                break;
            }

            switch (frame->type)
            {
            case FrameType::EVENT:
                if (verifier->verify(*frame->event))
                {
                    leg.events.push_back(*frame->event);
                }
                else
                {
                    leg.rejected++;
                    PLOG_WARNING << "Rejected event " << frame->event->id << " from relay " << relayUrl << ": verification failed.";
                }
                break;

            case FrameType::EOSE:
                finished = true;
                break;

            case FrameType::CLOSED:
                PLOG_WARNING << "Relay " << relayUrl << " closed subscription " << subscriptionId << ": " << frame->message;
                finished = true;
                break;

            case FrameType::NOTICE:
                PLOG_INFO << "Notice from relay " << relayUrl << ": " << frame->message;
                break;

            case FrameType::AUTH:
                PLOG_INFO << "Ignoring AUTH challenge from relay " << relayUrl;
                break;

            case FrameType::OK:
                break;
            }
        }
    }
    catch (const ConnectionError& ce)
    {
        PLOG_WARNING << "Lost connection to relay " << relayUrl << " during query: " << ce.what();
        connection->closeSubscription(subscriptionId);
        pool->reportFailure(relayUrl);
        return leg;
    }

    if (!finished)
    {
        PLOG_WARNING << "Relay " << relayUrl << " did not finish subscription " << subscriptionId << " in time.";
    }

    connection->closeSubscription(subscriptionId);
    try
    {
        connection->send(serializeClose(subscriptionId));
    }
    catch (const ConnectionError& ce)
    {
        PLOG_DEBUG << "Could not close subscription " << subscriptionId << " on relay " << relayUrl << ": " << ce.what();
    }

    pool->markActive(relayUrl);
    leg.succeeded = true;
    return leg;
};

bool QueryAggregator::_publishTo(
    shared_ptr<RelayPool> pool,
    string relayUrl,
    Event event,
    chrono::milliseconds timeout)
{
    auto deadline = chrono::steady_clock::now() + timeout;
    shared_ptr<IRelayConnection> connection;
    optional<bool> accepted;

    try
    {
        // The relay's OK is addressed by event ID.
        connection = pool->getConnection(relayUrl);
        connection->openSubscription(event.id);
        connection->send(serializePublish(event));

        while (!accepted.has_value())
        {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                break;
            }

            optional<Frame> frame = connection->receive(event.id, remaining);
            if (!frame.has_value())
            {
                break;
            }
            if (frame->type != FrameType::OK)
            {
                continue;
            }

            pool->markActive(relayUrl);
            if (!frame->accepted)
            {
                PLOG_WARNING << "Relay " << relayUrl << " rejected event " << event.id << ": " << frame->message;
            }
            accepted = frame->accepted;
        }
    }
    catch (const ConnectionError& ce)
    {
        PLOG_WARNING << "Failed to publish event " << event.id << " to relay " << relayUrl << ": " << ce.what();
    }

    if (connection != nullptr)
    {
        connection->closeSubscription(event.id);
    }

    if (!accepted.has_value())
    {
        PLOG_WARNING << "Relay " << relayUrl << " did not acknowledge event " << event.id << ".";
        return false;
    }
    return *accepted;
};
