#include <stdexcept>

#include "service/relay_connection.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::client;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace std;

RelayConnection::RelayConnection(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IWebSocketClient> client,
    string url,
    chrono::milliseconds connectTimeout)
{
    hydrator::internal::initLogging(appender);

    this->_client = client;
    this->_url = url;
    this->_connectTimeout = connectTimeout;
    this->_session = make_shared<Session>();
};

RelayConnection::~RelayConnection()
{
    this->close();
};

string RelayConnection::url() const
{
    return this->_url;
};

void RelayConnection::connect()
{
    lock_guard<mutex> lock(this->_stateMutex);
    if (this->_connected)
    {
        bool peerClosed;
        {
            lock_guard<mutex> sessionLock(this->_session->mutex);
            peerClosed = this->_session->peerClosed;
        }
        if (!peerClosed && this->_client->isConnected(this->_sessionId))
        {
            return;
        }

        // Discard what is left of the dead session before starting a new one.
        this->_connected = false;
        this->_client->closeConnection(this->_sessionId);
    }

    auto session = make_shared<Session>();
    string relayUrl = this->_url;

    SessionHandlers handlers;
    handlers.onMessage = [session, relayUrl](const string& payload)
    {
        _deliver(*session, relayUrl, payload);
    };
    handlers.onClose = [session]()
    {
        {
            lock_guard<mutex> sessionLock(session->mutex);
            session->peerClosed = true;
        }
        session->ready.notify_all();
    };
    handlers.onPing = [session]()
    {
        lock_guard<mutex> sessionLock(session->mutex);
        session->lastActivity = chrono::system_clock::now();
    };

    SessionId sessionId = this->_client->openConnection(this->_url, handlers, this->_connectTimeout);

    {
        lock_guard<mutex> sessionLock(session->mutex);
        session->lastActivity = chrono::system_clock::now();
    }
    this->_session = session;
    this->_sessionId = sessionId;
    this->_connected = true;
};

bool RelayConnection::isConnected() const
{
    SessionId sessionId;
    shared_ptr<Session> session;
    {
        lock_guard<mutex> lock(this->_stateMutex);
        if (!this->_connected)
        {
            return false;
        }
        sessionId = this->_sessionId;
        session = this->_session;
    }

    {
        lock_guard<mutex> sessionLock(session->mutex);
        if (session->peerClosed)
        {
            return false;
        }
    }

    return this->_client->isConnected(sessionId);
};

void RelayConnection::send(const string& message)
{
    if (!this->isConnected())
    {
        throw NotConnectedError("RelayConnection::send: Not connected to relay " + this->_url + ".");
    }

    SessionId sessionId;
    {
        lock_guard<mutex> lock(this->_stateMutex);
        sessionId = this->_sessionId;
    }

    auto [uri, success] = this->_client->send(message, sessionId);
    if (!success)
    {
        throw ConnectionError("RelayConnection::send: Failed to send message to relay " + this->_url + ".");
    }

    PLOG_VERBOSE << "Sent message to relay " << this->_url << ": " << message;
};

void RelayConnection::openSubscription(const string& subscriptionId)
{
    if (!this->_connected)
    {
        throw NotConnectedError("RelayConnection::openSubscription: Not connected to relay " + this->_url + ".");
    }

    auto session = this->_currentSession();
    lock_guard<mutex> sessionLock(session->mutex);
    session->subscriptions.try_emplace(subscriptionId);
};

optional<Frame> RelayConnection::receive(const string& subscriptionId, chrono::milliseconds timeout)
{
    if (!this->_connected)
    {
        throw NotConnectedError("RelayConnection::receive: Not connected to relay " + this->_url + ".");
    }

    auto session = this->_currentSession();
    unique_lock<mutex> sessionLock(session->mutex);

    auto it = session->subscriptions.find(subscriptionId);
    if (it == session->subscriptions.end())
    {
        throw invalid_argument("RelayConnection::receive: Subscription " + subscriptionId + " is not open on relay " + this->_url + ".");
    }

    // Elements of an unordered_map keep their address when other subscriptions are added.
    deque<Frame>& frames = it->second;
    session->ready.wait_for(sessionLock, timeout, [&session, &frames]()
    {
        return !frames.empty() || session->peerClosed || session->closedLocally;
    });

    // Frames that arrived before the close are still delivered.
    if (frames.empty())
    {
        if (session->closedLocally)
        {
            throw NotConnectedError("RelayConnection::receive: Connection to relay " + this->_url + " was closed.");
        }
        if (session->peerClosed)
        {
            throw ConnectionError("RelayConnection::receive: Relay " + this->_url + " closed the connection.");
        }
        return nullopt;
    }

    Frame frame = frames.front();
    frames.pop_front();
    return frame;
};

void RelayConnection::closeSubscription(const string& subscriptionId)
{
    auto session = this->_currentSession();
    lock_guard<mutex> sessionLock(session->mutex);
    session->subscriptions.erase(subscriptionId);
};

void RelayConnection::close()
{
    lock_guard<mutex> lock(this->_stateMutex);
    if (!this->_connected)
    {
        return;
    }

    this->_connected = false;
    {
        lock_guard<mutex> sessionLock(this->_session->mutex);
        this->_session->closedLocally = true;
    }
    this->_session->ready.notify_all();

    this->_client->closeConnection(this->_sessionId);
    PLOG_INFO << "Closed connection to relay " << this->_url;
};

chrono::system_clock::time_point RelayConnection::lastActivity() const
{
    auto session = this->_currentSession();
    lock_guard<mutex> sessionLock(session->mutex);
    return session->lastActivity;
};

shared_ptr<RelayConnection::Session> RelayConnection::_currentSession() const
{
    lock_guard<mutex> lock(this->_stateMutex);
    return this->_session;
};

void RelayConnection::_deliver(Session& session, const string& relayUrl, const string& payload)
{
    PLOG_VERBOSE << "Received message from relay " << relayUrl << ": " << payload;

    Frame frame;
    try
    {
        frame = Frame::fromString(payload);
    }
    catch (const ProtocolError& pe)
    {
        PLOG_WARNING << "Dropping malformed frame from relay " << relayUrl << ": " << pe.what();
        return;
    }

    {
        lock_guard<mutex> sessionLock(session.mutex);
        session.lastActivity = chrono::system_clock::now();

        string target = frame.target();
        if (target.empty())
        {
            for (auto& [subscriptionId, frames] : session.subscriptions)
            {
                frames.push_back(frame);
            }
        }
        else
        {
            auto it = session.subscriptions.find(target);
            if (it == session.subscriptions.end())
            {
                PLOG_VERBOSE << "Dropping " << toString(frame.type) << " frame for " << target
                             << " from relay " << relayUrl << ": nobody is reading it.";
                return;
            }
            it->second.push_back(frame);
        }
    }
    session.ready.notify_all();
};
