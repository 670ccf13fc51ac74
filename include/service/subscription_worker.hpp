#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
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
 * @brief A thread-safe flag used to ask a long-running operation to stop.
 */
class CancellationToken
{
public:
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Waits for the given duration or until the token is cancelled, whichever is first.
     * @returns True if the token was cancelled.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _cancelled;
    bool _isCancelled = false;
};

enum class WorkerState
{
    Connecting,
    Subscribed,
    Receiving,
    Reconnecting,
    Stopped
};

std::string toString(WorkerState state);

/**
 * @brief Keeps one subscription open on one relay for as long as the caller wants it.
 * @remark The worker reconnects with a fixed backoff whenever the connection drops or the relay
 * closes the subscription, and resubscribes with a fresh subscription ID each time.
 */
class SubscriptionWorker
{
public:
    typedef std::function<void(const data::Event& event, const std::string& relayUrl)> EventHandler;

    SubscriptionWorker(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<RelayPool> pool,
        std::shared_ptr<cryptography::IEventVerifier> verifier,
        std::chrono::milliseconds receiveTimeout = std::chrono::seconds(5),
        std::chrono::milliseconds backoff = std::chrono::seconds(5));

    /**
     * @brief Subscribes to the given relay and delivers every verified event to `onEvent` until
     * the token is cancelled.
     * @throws `std::invalid_argument` if the filters are empty or invalid.
     * @remark Blocks the calling thread.  Cancellation is honored within one receive timeout.
     * Exceptions thrown by `onEvent` are logged and do not end the subscription.
     */
    void run(
        const std::string& relayUrl,
        const std::vector<data::Filters>& filters,
        EventHandler onEvent,
        CancellationToken& cancellationToken);

    WorkerState state() const;

    /**
     * @brief Gets the ID of the current subscription, or an empty string before the first REQ.
     */
    std::string subscriptionId() const;

    int reconnects() const;

    int delivered() const;

    int rejected() const;

private:
    std::shared_ptr<RelayPool> _pool;
    std::shared_ptr<cryptography::IEventVerifier> _verifier;
    std::chrono::milliseconds _receiveTimeout;
    std::chrono::milliseconds _backoff;

    std::atomic<WorkerState> _state{ WorkerState::Stopped };
    std::atomic<int> _reconnects{ 0 };
    std::atomic<int> _delivered{ 0 };
    std::atomic<int> _rejected{ 0 };

    mutable std::mutex _subscriptionMutex;
    std::string _subscriptionId;

    void _setState(WorkerState state, const std::string& relayUrl);

    void _setSubscriptionId(const std::string& subscriptionId);

    /**
     * @brief Reads frames until the token is cancelled or the relay closes the subscription.
     * @throws `ConnectionError` if the connection drops.
     */
    void _receive(
        std::shared_ptr<IRelayConnection> connection,
        const std::string& relayUrl,
        const std::string& subscriptionId,
        const EventHandler& onEvent,
        const CancellationToken& cancellationToken);
};
} // namespace service
} // namespace hydrator
