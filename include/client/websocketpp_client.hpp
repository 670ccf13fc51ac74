#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <plog/Log.h>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "web_socket_client.hpp"

namespace hydrator
{
namespace client
{
/**
 * @brief An implementation of the `IWebSocketClient` interface that uses the WebSocket++ library.
 * @remark `ws://` and `wss://` URIs are served by separate endpoints sharing one asio event loop,
 * which runs on a thread owned by the client between `start()` and `stop()`.  TLS connections
 * verify the server's certificate chain and host name.
 */
class WebsocketppClient : public IWebSocketClient
{
public:
    WebsocketppClient(std::shared_ptr<plog::IAppender> appender);

    ~WebsocketppClient();

    void start() override;

    void stop() override;

    SessionId openConnection(
        std::string uri,
        SessionHandlers handlers,
        std::chrono::milliseconds timeout) override;

    bool isConnected(SessionId session) override;

    std::tuple<std::string, bool> send(std::string message, SessionId session) override;

    void closeConnection(SessionId session) override;

private:
    typedef websocketpp::client<websocketpp::config::asio_client> websocketpp_client;
    typedef websocketpp::client<websocketpp::config::asio_tls_client> websocketpp_tls_client;

    struct Session
    {
        std::string uri;
        SessionHandlers handlers;
        websocketpp::connection_hdl handle;
        bool open = false;
    };

    websocketpp::lib::asio::io_service _ioService;
    websocketpp_client _client;
    websocketpp_tls_client _tlsClient;
    std::thread _ioThread;
    bool _started = false;

    std::atomic<SessionId> _nextSession{ 1 };
    std::unordered_map<SessionId, Session> _sessions;
    std::mutex _propertyMutex;

    /**
     * @brief Creates a connection on the given endpoint, binds it to the session, and waits for
     * the handshake.
     */
    template <typename Endpoint>
    void _connect(
        Endpoint& endpoint,
        SessionId session,
        const std::string& uri,
        std::chrono::milliseconds timeout);

    void _dispatchMessage(SessionId session, const std::string& payload);

    void _dispatchClose(SessionId session);

    void _dispatchPing(SessionId session);

    static bool _isSecure(const std::string& uri);
};
} // namespace client
} // namespace hydrator
