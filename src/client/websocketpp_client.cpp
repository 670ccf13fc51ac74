#include <atomic>
#include <future>
#include <vector>

#include "client/websocketpp_client.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::client;
using namespace std;

using websocketpp::lib::error_code;

WebsocketppClient::WebsocketppClient(shared_ptr<plog::IAppender> appender)
{
    hydrator::internal::initLogging(appender);

    // Relay traffic is logged through plog; silence WebSocket++'s own stderr logging.
    this->_client.clear_access_channels(websocketpp::log::alevel::all);
    this->_client.clear_error_channels(websocketpp::log::elevel::all);
    this->_tlsClient.clear_access_channels(websocketpp::log::alevel::all);
    this->_tlsClient.clear_error_channels(websocketpp::log::elevel::all);

    this->_client.init_asio(&this->_ioService);
    this->_tlsClient.init_asio(&this->_ioService);

    this->_tlsClient.set_tls_init_handler([this](websocketpp::connection_hdl handle)
    {
        namespace ssl = websocketpp::lib::asio::ssl;
        auto context = websocketpp::lib::make_shared<ssl::context>(ssl::context::sslv23_client);
        context->set_options(
            ssl::context::default_workarounds
            | ssl::context::no_sslv2
            | ssl::context::no_sslv3
            | ssl::context::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(ssl::verify_peer);

        // The certificate must name the host we dialed, not just chain to a trusted root.
        error_code lookupError;
        auto connection = this->_tlsClient.get_con_from_hdl(handle, lookupError);
        string host = lookupError ? string() : connection->get_host();
        context->set_verify_callback(ssl::host_name_verification(host));
        return context;
    });
};

WebsocketppClient::~WebsocketppClient()
{
    this->stop();
};

void WebsocketppClient::start()
{
    if (this->_started)
    {
        return;
    }

    this->_client.start_perpetual();
    this->_tlsClient.start_perpetual();
    this->_ioThread = thread([this]() { this->_ioService.run(); });
    this->_started = true;
};

void WebsocketppClient::stop()
{
    if (!this->_started)
    {
        return;
    }

    vector<SessionId> sessions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const auto& [session, properties] : this->_sessions)
        {
            sessions.push_back(session);
        }
    }
    for (SessionId session : sessions)
    {
        this->closeConnection(session);
    }

    this->_client.stop_perpetual();
    this->_tlsClient.stop_perpetual();
    this->_ioService.stop();

    if (this->_ioThread.joinable())
    {
        this->_ioThread.join();
    }
    this->_started = false;
};

SessionId WebsocketppClient::openConnection(string uri, SessionHandlers handlers, chrono::milliseconds timeout)
{
    if (!this->_started)
    {
        throw ConnectionError("WebsocketppClient::openConnection: The client has not been started.");
    }

    SessionId session = this->_nextSession++;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        Session& properties = this->_sessions[session];
        properties.uri = uri;
        properties.handlers = handlers;
    }

    try
    {
        if (_isSecure(uri))
        {
            this->_connect(this->_tlsClient, session, uri, timeout);
        }
        else
        {
            this->_connect(this->_client, session, uri, timeout);
        }
    }
    catch (const ConnectionError&)
    {
        // Late callbacks from the failed attempt find no session and are ignored.
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_sessions.erase(session);
        throw;
    }

    return session;
};

bool WebsocketppClient::isConnected(SessionId session)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_sessions.find(session);
    return it != this->_sessions.end() && it->second.open;
};

tuple<string, bool> WebsocketppClient::send(string message, SessionId session)
{
    error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_sessions.find(session);
    if (it == this->_sessions.end())
    {
        return make_tuple(string(), false);
    }

    const Session& properties = it->second;
    if (!properties.open)
    {
        return make_tuple(properties.uri, false);
    }

    if (_isSecure(properties.uri))
    {
        this->_tlsClient.send(properties.handle, message, websocketpp::frame::opcode::text, error);
    }
    else
    {
        this->_client.send(properties.handle, message, websocketpp::frame::opcode::text, error);
    }

    if (error)
    {
        PLOG_WARNING << "Failed to send message to relay " << properties.uri << ": " << error.message();
        return make_tuple(properties.uri, false);
    }

    return make_tuple(properties.uri, true);
};

void WebsocketppClient::closeConnection(SessionId session)
{
    string uri;
    websocketpp::connection_hdl handle;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_sessions.find(session);
        if (it == this->_sessions.end())
        {
            return;
        }

        uri = it->second.uri;
        handle = it->second.handle;
        bool open = it->second.open;
        this->_sessions.erase(it);
        if (!open)
        {
            return;
        }
    }

    error_code error;
    if (_isSecure(uri))
    {
        this->_tlsClient.close(handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }
    else
    {
        this->_client.close(handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }

    if (error)
    {
        PLOG_VERBOSE << "Error closing connection to relay " << uri << ": " << error.message();
    }
};

template <typename Endpoint>
void WebsocketppClient::_connect(
    Endpoint& endpoint,
    SessionId session,
    const string& uri,
    chrono::milliseconds timeout)
{
    error_code error;
    auto connection = endpoint.get_connection(uri, error);
    if (error)
    {
        throw ConnectionError("WebsocketppClient::openConnection: Invalid relay URI " + uri + ": " + error.message());
    }

    auto handshake = make_shared<promise<bool>>();
    auto failureReason = make_shared<string>("Handshake failed.");
    auto abandoned = make_shared<atomic<bool>>(false);
    future<bool> handshakeFuture = handshake->get_future();

    connection->set_open_handler([&endpoint, handshake, abandoned](websocketpp::connection_hdl handle)
    {
        if (abandoned->load())
        {
            error_code closeError;
            endpoint.close(handle, websocketpp::close::status::going_away, "Handshake timed out.", closeError);
        }
        handshake->set_value(true);
    });

    connection->set_fail_handler([&endpoint, handshake, failureReason](websocketpp::connection_hdl handle)
    {
        error_code lookupError;
        auto failed = endpoint.get_con_from_hdl(handle, lookupError);
        if (!lookupError && failed->get_ec())
        {
            *failureReason = failed->get_ec().message();
        }
        handshake->set_value(false);
    });

    connection->set_message_handler([this, session](
        websocketpp::connection_hdl,
        typename Endpoint::message_ptr message)
    {
        this->_dispatchMessage(session, message->get_payload());
    });

    connection->set_close_handler([this, session](websocketpp::connection_hdl)
    {
        this->_dispatchClose(session);
    });

    // Returning true lets WebSocket++ answer the ping with a pong.
    connection->set_ping_handler([this, session](websocketpp::connection_hdl, string)
    {
        this->_dispatchPing(session);
        return true;
    });

    endpoint.connect(connection);

    if (handshakeFuture.wait_for(timeout) != future_status::ready)
    {
        abandoned->store(true);
        error_code closeError;
        connection->close(websocketpp::close::status::going_away, "Handshake timed out.", closeError);
        throw ConnectionError("WebsocketppClient::openConnection: Handshake with relay " + uri + " timed out.");
    }

    if (!handshakeFuture.get())
    {
        throw ConnectionError("WebsocketppClient::openConnection: Failed to connect to relay " + uri + ": " + *failureReason);
    }

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_sessions.find(session);
        if (it == this->_sessions.end())
        {
            throw ConnectionError("WebsocketppClient::openConnection: Connection to relay " + uri + " closed during the handshake.");
        }
        it->second.handle = connection->get_handle();
        it->second.open = true;
    }
    PLOG_INFO << "Connected to relay " << uri << " (session " << session << ")";
};

void WebsocketppClient::_dispatchMessage(SessionId session, const string& payload)
{
    function<void(const string&)> handler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_sessions.find(session);
        if (it == this->_sessions.end())
        {
            return;
        }
        handler = it->second.handlers.onMessage;
    }

    if (handler)
    {
        handler(payload);
    }
};

void WebsocketppClient::_dispatchClose(SessionId session)
{
    string uri;
    function<void()> handler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_sessions.find(session);
        if (it == this->_sessions.end())
        {
            return;
        }
        uri = it->second.uri;
        handler = it->second.handlers.onClose;
        this->_sessions.erase(it);
    }

    PLOG_INFO << "Connection to relay " << uri << " (session " << session << ") closed.";
    if (handler)
    {
        handler();
    }
};

void WebsocketppClient::_dispatchPing(SessionId session)
{
    function<void()> handler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_sessions.find(session);
        if (it == this->_sessions.end())
        {
            return;
        }
        handler = it->second.handlers.onPing;
    }

    if (handler)
    {
        handler();
    }
};

bool WebsocketppClient::_isSecure(const string& uri)
{
    return uri.rfind("wss://", 0) == 0;
};
