#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <plog/Log.h>

#include "client/web_socket_client.hpp"
#include "data/message.hpp"

namespace hydrator
{
namespace service
{
/**
 * @brief A single WebSocket session with a single relay.
 */
class IRelayConnection
{
public:
    virtual ~IRelayConnection() = default;

    /**
     * @brief Gets the URL of the relay this connection talks to.
     */
    virtual std::string url() const = 0;

    /**
     * @brief Opens the connection.  Does nothing if the connection is already open.
     * @throws `ConnectionError` if the handshake fails or times out.
     */
    virtual void connect() = 0;

    /**
     * @brief Indicates whether the connection is open and has not been closed by the peer.
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Sends a serialized client message to the relay.
     * @throws `NotConnectedError` if the connection is not open.
     * @throws `ConnectionError` if the transport fails to send the message.
     */
    virtual void send(const std::string& message) = 0;

    /**
     * @brief Starts buffering the frames addressed to the given subscription.
     * @remark EVENT, EOSE and CLOSED frames are addressed by their subscription ID and OK frames
     * by their event ID, so a publish opens a subscription named after the event it sends.
     * NOTICE and AUTH frames are delivered to every open subscription.  Frames addressed to no
     * open subscription are dropped.
     * @throws `NotConnectedError` if the connection is not open.
     */
    virtual void openSubscription(const std::string& subscriptionId) = 0;

    /**
     * @brief Takes the next frame addressed to the given subscription, waiting up to `timeout`
     * for one.
     * @returns The next frame, or `std::nullopt` if none arrived in time.
     * @throws `ConnectionError` once the relay has closed the socket and every frame the
     * subscription received before the close has been taken.
     * @throws `NotConnectedError` if the connection was never opened or has been closed locally.
     * @throws `std::invalid_argument` if the subscription is not open on this connection.
     */
    virtual std::optional<data::Frame> receive(
        const std::string& subscriptionId,
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stops buffering frames for the given subscription and discards any left unread.
     */
    virtual void closeSubscription(const std::string& subscriptionId) = 0;

    /**
     * @brief Closes the connection.  Does nothing if it is already closed.
     */
    virtual void close() = 0;

    /**
     * @brief Gets the time of the most recent traffic from the relay, including pings.
     * @returns The epoch if nothing has been received yet.
     */
    virtual std::chrono::system_clock::time_point lastActivity() const = 0;
};

/**
 * @brief An `IRelayConnection` over the shared WebSocket client.
 * @remark Frames are parsed as they arrive and buffered per subscription, in arrival order, until
 * they are taken by `receive`.  Malformed payloads are logged and dropped.  Ping frames are
 * answered by the WebSocket client and only refresh `lastActivity`.  AUTH challenges are surfaced
 * as frames and never answered automatically.
 */
class RelayConnection : public IRelayConnection
{
public:
    RelayConnection(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::string url,
        std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));

    ~RelayConnection();

    std::string url() const override;

    void connect() override;

    bool isConnected() const override;

    void send(const std::string& message) override;

    void openSubscription(const std::string& subscriptionId) override;

    std::optional<data::Frame> receive(
        const std::string& subscriptionId,
        std::chrono::milliseconds timeout) override;

    void closeSubscription(const std::string& subscriptionId) override;

    void close() override;

    std::chrono::system_clock::time_point lastActivity() const override;

private:
    /**
     * @brief The state of one WebSocket session, shared with the WebSocket client's handlers so
     * that a handler running late never touches a destroyed connection.
     */
    struct Session
    {
        std::mutex mutex;
        std::condition_variable ready;
        std::unordered_map<std::string, std::deque<data::Frame>> subscriptions;
        bool peerClosed = false;
        bool closedLocally = false;
        std::chrono::system_clock::time_point lastActivity;
    };

    std::shared_ptr<client::IWebSocketClient> _client;
    std::string _url;
    std::chrono::milliseconds _connectTimeout;

    mutable std::mutex _stateMutex;
    std::shared_ptr<Session> _session;
    client::SessionId _sessionId = 0;
    std::atomic<bool> _connected{ false };

    std::shared_ptr<Session> _currentSession() const;

    /**
     * @brief Parses a payload and queues it for the subscriptions it is addressed to.
     */
    static void _deliver(Session& session, const std::string& relayUrl, const std::string& payload);
};
} // namespace service
} // namespace hydrator
