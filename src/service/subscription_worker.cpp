#include <exception>
#include <stdexcept>

#include "service/subscription_worker.hpp"
#include "data/message.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace std;

#pragma region CancellationToken

void CancellationToken::cancel()
{
    {
        lock_guard<mutex> lock(this->_mutex);
        this->_isCancelled = true;
    }
    this->_cancelled.notify_all();
};

bool CancellationToken::isCancelled() const
{
    lock_guard<mutex> lock(this->_mutex);
    return this->_isCancelled;
};

bool CancellationToken::waitFor(chrono::milliseconds duration) const
{
    unique_lock<mutex> lock(this->_mutex);
    return this->_cancelled.wait_for(lock, duration, [this]() { return this->_isCancelled; });
};

#pragma endregion

string hydrator::service::toString(WorkerState state)
{
    switch (state)
    {
    case WorkerState::Connecting:
        return "Connecting";
    case WorkerState::Subscribed:
        return "Subscribed";
    case WorkerState::Receiving:
        return "Receiving";
    case WorkerState::Reconnecting:
        return "Reconnecting";
    case WorkerState::Stopped:
        return "Stopped";
    }

    return "Unknown";
};

#pragma region SubscriptionWorker

SubscriptionWorker::SubscriptionWorker(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<RelayPool> pool,
    shared_ptr<IEventVerifier> verifier,
    chrono::milliseconds receiveTimeout,
    chrono::milliseconds backoff)
{
    hydrator::internal::initLogging(appender);

    this->_pool = pool;
    this->_verifier = verifier;
    this->_receiveTimeout = receiveTimeout;
    this->_backoff = backoff;
};

void SubscriptionWorker::run(
    const string& relayUrl,
    const vector<Filters>& filters,
    EventHandler onEvent,
    CancellationToken& cancellationToken)
{
    if (filters.empty())
    {
        throw invalid_argument("SubscriptionWorker::run: At least one filter is required.");
    }
    for (const auto& filter : filters)
    {
        filter.validate();
    }

    string url = RelayPool::normalizeUrl(relayUrl);
    shared_ptr<IRelayConnection> connection;
    string subscriptionId;

    while (!cancellationToken.isCancelled())
    {
        this->_setState(WorkerState::Connecting, url);
        connection = nullptr;

        try
        {
            connection = this->_pool->getConnection(url);

            subscriptionId = generateSubscriptionId();
            this->_setSubscriptionId(subscriptionId);
            connection->openSubscription(subscriptionId);
            connection->send(serializeRequest(subscriptionId, filters));
            this->_setState(WorkerState::Subscribed, url);
            PLOG_INFO << "Subscribed to relay " << url << " with subscription " << subscriptionId;

            this->_setState(WorkerState::Receiving, url);
            this->_receive(connection, url, subscriptionId, onEvent, cancellationToken);
        }
        catch (const ConnectionError& ce)
        {
            PLOG_WARNING << "Subscription " << subscriptionId << " to relay " << url << " interrupted: " << ce.what();

            // Connection failures are already counted by the pool.
            if (connection != nullptr)
            {
                this->_pool->reportFailure(url);
            }
        }

        if (connection != nullptr)
        {
            connection->closeSubscription(subscriptionId);
        }

        if (cancellationToken.isCancelled())
        {
            break;
        }

        this->_setState(WorkerState::Reconnecting, url);
        this->_reconnects++;
        PLOG_INFO << "Reconnecting to relay " << url << " in " << this->_backoff.count() << "ms.";
        if (cancellationToken.waitFor(this->_backoff))
        {
            break;
        }
    }

    if (connection != nullptr && !subscriptionId.empty())
    {
        try
        {
            connection->send(serializeClose(subscriptionId));
        }
        catch (const ConnectionError& ce)
        {
            PLOG_DEBUG << "Could not close subscription " << subscriptionId << " on relay " << url << ": " << ce.what();
        }
    }
    this->_pool->closeRelay(url);

    this->_setState(WorkerState::Stopped, url);
    PLOG_INFO << "Subscription worker for relay " << url << " stopped after delivering "
              << this->_delivered << " events.";
};

WorkerState SubscriptionWorker::state() const
{
    return this->_state;
};

string SubscriptionWorker::subscriptionId() const
{
    lock_guard<mutex> lock(this->_subscriptionMutex);
    return this->_subscriptionId;
};

int SubscriptionWorker::reconnects() const
{
    return this->_reconnects;
};

int SubscriptionWorker::delivered() const
{
    return this->_delivered;
};

int SubscriptionWorker::rejected() const
{
    return this->_rejected;
};

void SubscriptionWorker::_setState(WorkerState state, const string& relayUrl)
{
    WorkerState previous = this->_state.exchange(state);
    if (previous != state)
    {
        PLOG_DEBUG << "Subscription worker for relay " << relayUrl << ": " << toString(previous) << " -> " << toString(state);
    }
};

void SubscriptionWorker::_setSubscriptionId(const string& subscriptionId)
{
    lock_guard<mutex> lock(this->_subscriptionMutex);
    this->_subscriptionId = subscriptionId;
};

void SubscriptionWorker::_receive(
    shared_ptr<IRelayConnection> connection,
    const string& relayUrl,
    const string& subscriptionId,
    const EventHandler& onEvent,
    const CancellationToken& cancellationToken)
{
    while (!cancellationToken.isCancelled())
    {
        optional<Frame> frame = connection->receive(subscriptionId, this->_receiveTimeout);
        if (!frame.has_value())
        {
            continue;
        }
        this->_pool->markActive(relayUrl);

        switch (frame->type)
        {
        case FrameType::EVENT:
        {
            const Event& event = *frame->event;
            if (!this->_verifier->verify(event))
            {
                this->_rejected++;
                PLOG_WARNING << "Rejected event " << event.id << " from relay " << relayUrl << ": verification failed.";
                break;
            }

            try
            {
                onEvent(event, relayUrl);
                this->_delivered++;
            }
            catch (const exception& e)
            {
                PLOG_ERROR << "Failed to handle event " << event.id << " from relay " << relayUrl << ": " << e.what();
            }
            catch (...)
            {
                PLOG_ERROR << "Failed to handle event " << event.id << " from relay " << relayUrl << ": unknown exception.";
            }
            break;
        }

        case FrameType::EOSE:
            PLOG_INFO << "Subscription " << subscriptionId << " caught up with stored events on relay " << relayUrl;
            break;

        case FrameType::CLOSED:
            PLOG_WARNING << "Relay " << relayUrl << " closed subscription " << subscriptionId << ": " << frame->message;
            return;

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
};

#pragma endregion
