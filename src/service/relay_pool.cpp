#include <algorithm>
#include <cctype>

#include "service/relay_pool.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::service;
using namespace std;

const vector<string> RelayPool::publicRelays =
{
    "wss://theforest.nostr1.com",
    "wss://nostr.land",
    "wss://relay.primal.net"
};

RelayPool::RelayPool(
    shared_ptr<plog::IAppender> appender,
    ConnectionFactory connectionFactory,
    vector<string> configuredRelays,
    string localRelay,
    Clock clock)
{
    hydrator::internal::initLogging(appender);

    this->_connectionFactory = connectionFactory;
    this->_clock = clock;
    this->_localRelay = normalizeUrl(localRelay);

    // Prioritize the local relay, then the configured relays, then the public relays.
    if (!this->_localRelay.empty())
    {
        this->_defaultRelays.push_back(this->_localRelay);
        PLOG_INFO << "Local relay " << this->_localRelay << " configured as primary.";
    }

    const vector<string>& fallback = configuredRelays.empty() ? publicRelays : configuredRelays;
    for (const auto& relay : fallback)
    {
        string url = normalizeUrl(relay);
        if (url.empty())
        {
            continue;
        }
        if (find(this->_defaultRelays.begin(), this->_defaultRelays.end(), url) == this->_defaultRelays.end())
        {
            this->_defaultRelays.push_back(url);
        }
    }

    PLOG_INFO << "Relay pool initialized with " << this->_defaultRelays.size() << " default relays.";
};

shared_ptr<IRelayConnection> RelayPool::getConnection(const string& url)
{
    string relayUrl = normalizeUrl(url);

    {
        lock_guard<mutex> lock(this->_poolMutex);
        auto it = this->_relays.find(relayUrl);
        if (it != this->_relays.end() && it->second.connection && it->second.connection->isConnected())
        {
            return it->second.connection;
        }
    }

    PLOG_DEBUG << "Creating new connection to relay " << relayUrl;
    shared_ptr<IRelayConnection> connection = this->_connectionFactory(relayUrl);

    try
    {
        connection->connect();
    }
    catch (const ConnectionError& ce)
    {
        lock_guard<mutex> lock(this->_poolMutex);
        Relay& relay = this->_relays[relayUrl];
        relay.failedAttempts++;
        PLOG_WARNING << "Failed to connect to relay " << relayUrl << " (attempt " << relay.failedAttempts << "): " << ce.what();
        throw;
    }

    shared_ptr<IRelayConnection> stale;
    {
        lock_guard<mutex> lock(this->_poolMutex);
        Relay& relay = this->_relays[relayUrl];

        // Another caller may have connected to the same relay while this one was connecting.
        if (relay.connection && relay.connection != connection && relay.connection->isConnected())
        {
            stale = connection;
            connection = relay.connection;
        }
        else
        {
            stale = relay.connection;
            relay.connection = connection;
            relay.failedAttempts = 0;
            relay.lastConnected = this->_clock();
        }
    }

    if (stale && stale != connection)
    {
        stale->close();
    }

    return connection;
};

void RelayPool::markActive(const string& url)
{
    lock_guard<mutex> lock(this->_poolMutex);
    auto it = this->_relays.find(normalizeUrl(url));
    if (it != this->_relays.end())
    {
        it->second.lastConnected = this->_clock();
    }
};

void RelayPool::reportFailure(const string& url)
{
    lock_guard<mutex> lock(this->_poolMutex);
    Relay& relay = this->_relays[normalizeUrl(url)];
    relay.failedAttempts++;
    PLOG_DEBUG << "Relay " << url << " has failed " << relay.failedAttempts << " consecutive times.";
};

int RelayPool::cleanupStale(chrono::seconds maxAge)
{
    vector<shared_ptr<IRelayConnection>> removed;
    {
        lock_guard<mutex> lock(this->_poolMutex);
        auto now = this->_clock();

        for (auto it = this->_relays.begin(); it != this->_relays.end();)
        {
            auto lastTraffic = this->_lastTraffic(it->second);
            if (!it->second.connection || !lastTraffic.has_value())
            {
                ++it;
                continue;
            }

            auto age = chrono::duration_cast<chrono::seconds>(now - *lastTraffic);
            if (age > maxAge)
            {
                PLOG_INFO << "Removing stale connection to relay " << it->first << " (age " << age.count() << "s).";
                removed.push_back(it->second.connection);
                it = this->_relays.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const auto& connection : removed)
    {
        connection->close();
    }

    return static_cast<int>(removed.size());
};

void RelayPool::closeRelay(const string& url)
{
    shared_ptr<IRelayConnection> connection;
    {
        lock_guard<mutex> lock(this->_poolMutex);
        auto it = this->_relays.find(normalizeUrl(url));
        if (it == this->_relays.end())
        {
            return;
        }
        PLOG_DEBUG << "Closing connection to relay " << it->first;
        connection = it->second.connection;
        this->_relays.erase(it);
    }

    if (connection)
    {
        connection->close();
    }
};

void RelayPool::closeAll()
{
    map<string, Relay> relays;
    {
        lock_guard<mutex> lock(this->_poolMutex);
        relays.swap(this->_relays);
    }

    PLOG_INFO << "Closing all " << relays.size() << " relay connections.";
    for (auto& [url, relay] : relays)
    {
        if (relay.connection)
        {
            relay.connection->close();
        }
    }
};

PoolStats RelayPool::stats() const
{
    lock_guard<mutex> lock(this->_poolMutex);
    auto now = this->_clock();

    PoolStats poolStats;
    for (const auto& [url, relay] : this->_relays)
    {
        RelayStats relayStats;
        relayStats.url = url;
        relayStats.failedAttempts = relay.failedAttempts;
        relayStats.connected = relay.connection && relay.connection->isConnected();

        auto lastTraffic = this->_lastTraffic(relay);
        if (lastTraffic.has_value())
        {
            relayStats.lastConnected = chrono::system_clock::to_time_t(*lastTraffic);
            relayStats.age = chrono::duration_cast<chrono::seconds>(now - *lastTraffic).count();
        }

        if (relayStats.connected)
        {
            poolStats.activeConnections++;
        }
        poolStats.relays.push_back(relayStats);
    }

    return poolStats;
};

vector<string> RelayPool::defaultRelays() const
{
    return this->_defaultRelays;
};

string RelayPool::localRelay() const
{
    return this->_localRelay;
};

vector<string> RelayPool::ensureLocalRelayInList(vector<string> urls) const
{
    if (this->_localRelay.empty())
    {
        return urls;
    }

    for (const auto& url : urls)
    {
        if (normalizeUrl(url) == this->_localRelay)
        {
            return urls;
        }
    }

    urls.insert(urls.begin(), this->_localRelay);
    PLOG_DEBUG << "Added local relay " << this->_localRelay << " to the relay list.";
    return urls;
};

string RelayPool::normalizeUrl(const string& url)
{
    size_t start = 0;
    size_t end = url.length();
    while (start < end && isspace(static_cast<unsigned char>(url[start])))
    {
        start++;
    }
    while (end > start && (isspace(static_cast<unsigned char>(url[end - 1])) || url[end - 1] == '/'))
    {
        end--;
    }

    return url.substr(start, end - start);
};

optional<chrono::system_clock::time_point> RelayPool::_lastTraffic(const Relay& relay) const
{
    optional<chrono::system_clock::time_point> lastTraffic = relay.lastConnected;
    if (relay.connection)
    {
        auto activity = relay.connection->lastActivity();
        if (activity.time_since_epoch().count() > 0 && (!lastTraffic || activity > *lastTraffic))
        {
            lastTraffic = activity;
        }
    }

    return lastTraffic;
};
