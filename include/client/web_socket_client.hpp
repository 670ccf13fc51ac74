#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace hydrator
{
namespace client
{
/**
 * @brief Identifies one connection opened by an `IWebSocketClient`.
 * @remark IDs are never reused, so a stale ID can never address a newer connection to the same
 * server.
 */
typedef uint64_t SessionId;

/**
 * @brief Callbacks bound to a single connection.
 * @remark Handlers run on the client's I/O thread and must not block.  Any of them may be empty.
 */
struct SessionHandlers
{
    /// Invoked with every text payload the server sends.
    std::function<void(const std::string&)> onMessage;

    /// Invoked once when the server or the network closes the connection.
    std::function<void()> onClose;

    /// Invoked whenever the server pings the client.  The client answers pings itself.
    std::function<void()> onPing;
};

/**
 * @brief An interface for a WebSocket client shared by every relay connection.
 * @remark Several connections to the same URI may be open at once.  Each is addressed by the
 * `SessionId` returned when it was opened.
 */
class IWebSocketClient
{
public:
    virtual ~IWebSocketClient() = default;

    /**
     * @brief Starts the client.
     * @remark This method must be called before any other client methods.
     */
    virtual void start() = 0;

    /**
     * @brief Stops the client.
     * @remark This method should be called when the client is no longer needed, before it is
     * destroyed.
     */
    virtual void stop() = 0;

    /**
     * @brief Opens a connection to the given server, blocking until the WebSocket handshake
     * completes.
     * @param handlers The callbacks for this connection.  They are bound before the handshake
     * starts, so no payload is missed, and are dropped if the connection cannot be opened.
     * @param timeout The maximum time to wait for the handshake.
     * @returns The ID of the new connection.
     * @throws `ConnectionError` if the URI is invalid, the handshake fails, or the timeout elapses.
     */
    virtual SessionId openConnection(
        std::string uri,
        SessionHandlers handlers,
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Indicates whether the given connection is open.
     */
    virtual bool isConnected(SessionId session) = 0;

    /**
     * @brief Sends the given message over the given connection.
     * @returns A tuple indicating the server URI and whether the message was successfully
     * sent.
     */
    virtual std::tuple<std::string, bool> send(std::string message, SessionId session) = 0;

    /**
     * @brief Closes the given connection and forgets its handlers.
     * @remark Does nothing if the connection has already been closed by either side.
     */
    virtual void closeConnection(SessionId session) = 0;
};
} // namespace client
} // namespace hydrator
