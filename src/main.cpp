#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

#include <pthread.h>

#include <CLI/CLI.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Log.h>

#include "client/websocketpp_client.hpp"
#include "config/config.hpp"
#include "cryptography/event_verifier.hpp"
#include "data/data.hpp"
#include "errors.hpp"
#include "service/hydration_service.hpp"
#include "service/query_aggregator.hpp"
#include "service/relay_connection.hpp"
#include "service/relay_pool.hpp"
#include "signer/noscrypt_signer.hpp"
#include "store/sqlite_record_store.hpp"
#include "internal/logging.hpp"

using namespace hydrator;
using namespace std;

namespace
{
constexpr int EXIT_OK = 0;
constexpr int EXIT_UNREACHABLE = 1;
constexpr int EXIT_CONFIG = 2;

struct CommandLine
{
    string configPath;
    bool verbose = false;

    vector<int> kinds;
    vector<string> authors;
    long long since = 0;
    long long until = 0;
    int limit = 500;
    vector<string> relays;

    string eventFile;

    int publishKind = 1;
    string content;
    vector<string> tags;
};

/**
 * @brief Long-lived objects shared by every command that talks to relays.
 */
struct Runtime
{
    shared_ptr<client::WebsocketppClient> client;
    shared_ptr<service::RelayPool> pool;
    shared_ptr<cryptography::NoscryptVerifier> verifier;

    ~Runtime()
    {
        if (pool)
        {
            pool->closeAll();
        }
        if (client)
        {
            client->stop();
        }
    }
};

unique_ptr<Runtime> startRuntime(shared_ptr<plog::IAppender> appender, const config::Config& config)
{
    auto runtime = make_unique<Runtime>();
    runtime->client = make_shared<client::WebsocketppClient>(appender);
    runtime->client->start();

    auto webSocketClient = runtime->client;
    chrono::milliseconds connectTimeout = config.connectTimeout;
    runtime->pool = make_shared<service::RelayPool>(
        appender,
        [appender, webSocketClient, connectTimeout](const string& url)
        {
            return make_shared<service::RelayConnection>(appender, webSocketClient, url, connectTimeout);
        },
        config.relaysListed ? config.relays : vector<string>(),
        config.localRelay);
    runtime->verifier = make_shared<cryptography::NoscryptVerifier>(appender);

    return runtime;
}

service::HydrationOptions hydrationOptions(const config::Config& config)
{
    service::HydrationOptions options;
    options.perRelayTimeout = config.perRelayTimeout;
    options.overallTimeout = config.overallTimeout;
    options.receiveTimeout = config.receiveTimeout;
    options.backoff = config.backoff;
    return options;
}

data::Filters buildFilters(const CommandLine& args)
{
    data::Filters filters;
    filters.kinds = args.kinds;
    filters.authors = args.authors;
    filters.since = static_cast<time_t>(args.since);
    filters.until = static_cast<time_t>(args.until);
    filters.limit = args.limit;
    filters.validate();
    return filters;
}

void logPoolStats(const service::PoolStats& stats)
{
    PLOG_INFO << "Relay pool: " << stats.activeConnections << " active connections.";
    for (const auto& relay : stats.relays)
    {
        PLOG_INFO << "  " << relay.url << ": connected=" << relay.connected << ", failed attempts="
                  << relay.failedAttempts << ", age=" << relay.age << "s";
    }
}

int runBackfill(shared_ptr<plog::IAppender> appender, const config::Config& config, const CommandLine& args)
{
    data::Filters filters = buildFilters(args);

    auto runtime = startRuntime(appender, config);
    auto store = make_shared<store::SqliteRecordStore>(appender, config.storePath);
    service::HydrationService hydration(appender, runtime->pool, runtime->verifier, store, hydrationOptions(config));

    service::HydrationSummary summary = hydration.backfill(args.relays, { filters }, config.batchSize);

    cout << "fetched: " << summary.fetched << endl;
    cout << "saved: " << summary.saved << endl;
    cout << "skipped: " << summary.skipped << endl;
    cout << "errors: " << summary.errors << endl;
    cout << "rejected: " << summary.rejected << endl;
    cout << "relays reached: " << summary.relaysReached.size() << "/"
         << summary.relaysReached.size() + summary.relaysFailed.size() << endl;

    if (summary.relaysReached.empty())
    {
        PLOG_ERROR << "No relay could be reached.";
        return EXIT_UNREACHABLE;
    }

    return EXIT_OK;
}

/**
 * @brief Cancels the token when SIGINT or SIGTERM arrives.
 * @remark Must be constructed before any other thread is started, so that every thread inherits
 * the blocked signal mask and the signals are only ever taken by `sigwait`.
 */
class SignalWatcher
{
public:
    SignalWatcher(service::CancellationToken& cancellationToken)
    {
        sigemptyset(&this->_signals);
        sigaddset(&this->_signals, SIGINT);
        sigaddset(&this->_signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &this->_signals, nullptr);

        this->_thread = thread([this, &cancellationToken]()
        {
            int signal = 0;
            sigwait(&this->_signals, &signal);
            if (!this->_stopping)
            {
                PLOG_INFO << "Received signal " << signal << ", shutting down.";
                cancellationToken.cancel();
            }
        });
    };

    ~SignalWatcher()
    {
        this->_stopping = true;
        pthread_kill(this->_thread.native_handle(), SIGTERM);
        this->_thread.join();
    };

private:
    sigset_t _signals;
    atomic<bool> _stopping{ false };
    thread _thread;
};

/**
 * @brief Periodically evicts stale relay connections and logs pool stats while it is alive.
 */
class PoolJanitor
{
public:
    PoolJanitor(shared_ptr<service::RelayPool> pool, chrono::seconds interval, chrono::seconds maxAge)
    {
        this->_thread = thread([this, pool, interval, maxAge]()
        {
            while (!this->_stop.waitFor(interval))
            {
                int removed = pool->cleanupStale(maxAge);
                if (removed > 0)
                {
                    PLOG_INFO << "Removed " << removed << " stale relay connections.";
                }
                logPoolStats(pool->stats());
            }
        });
    };

    ~PoolJanitor()
    {
        this->_stop.cancel();
        this->_thread.join();
    };

private:
    service::CancellationToken _stop;
    thread _thread;
};

int runSubscribe(shared_ptr<plog::IAppender> appender, const config::Config& config, const CommandLine& args)
{
    data::Filters filters;
    filters.kinds = args.kinds;
    filters.authors = args.authors;
    filters.since = static_cast<time_t>(args.since);
    filters.validate();

    service::CancellationToken cancellationToken;
    SignalWatcher signalWatcher(cancellationToken);

    auto runtime = startRuntime(appender, config);
    auto store = make_shared<store::SqliteRecordStore>(appender, config.storePath);
    service::HydrationService hydration(appender, runtime->pool, runtime->verifier, store, hydrationOptions(config));
    PoolJanitor janitor(runtime->pool, config.cleanupInterval, config.poolMaxAge);

    string relay = args.relays.empty() ? string() : args.relays.front();
    service::SubscriptionSummary summary = hydration.subscribe(relay, { filters }, cancellationToken);

    cout << "delivered: " << summary.delivered << endl;
    cout << "saved: " << summary.saved << endl;
    cout << "skipped: " << summary.skipped << endl;
    cout << "errors: " << summary.errors << endl;
    cout << "rejected: " << summary.rejected << endl;
    cout << "reconnects: " << summary.reconnects << endl;

    return EXIT_OK;
}

int runVerify(shared_ptr<plog::IAppender> appender, const CommandLine& args)
{
    ifstream file(args.eventFile);
    if (!file)
    {
        PLOG_ERROR << "Cannot read event file " << args.eventFile;
        return EXIT_CONFIG;
    }

    stringstream buffer;
    buffer << file.rdbuf();

    data::Event event;
    try
    {
        event = data::Event::fromString(buffer.str());
    }
    catch (const InvalidEventError& ie)
    {
        cout << "invalid: " << ie.what() << endl;
        return EXIT_UNREACHABLE;
    }

    cryptography::NoscryptVerifier verifier(appender);
    if (!verifier.verify(event))
    {
        cout << "invalid: " << event.id << endl;
        return EXIT_UNREACHABLE;
    }

    cout << "valid: " << event.id << endl;
    return EXIT_OK;
}

int runPublish(shared_ptr<plog::IAppender> appender, const config::Config& config, const CommandLine& args)
{
    if (config.secretKey.empty())
    {
        throw ConfigError("Publishing requires signer.secret_key to be set.");
    }

    auto event = make_shared<data::Event>();
    event->kind = args.publishKind;
    event->content = args.content;
    for (const auto& tag : args.tags)
    {
        size_t separator = tag.find('=');
        if (separator == string::npos || separator == 0)
        {
            throw invalid_argument("Tags must be given as name=value, got " + tag + ".");
        }
        event->tags.push_back({ tag.substr(0, separator), tag.substr(separator + 1) });
    }

    signer::NoscryptSigner signer(appender, config.secretKey);
    signer.sign(event);

    auto runtime = startRuntime(appender, config);
    service::QueryAggregator aggregator(appender, runtime->pool, runtime->verifier);

    vector<string> relays = args.relays.empty()
        ? runtime->pool->defaultRelays()
        : runtime->pool->ensureLocalRelayInList(args.relays);
    auto [successes, failures] = aggregator.publish(relays, *event, config.perRelayTimeout);

    cout << "event: " << event->id << endl;
    cout << "accepted by: " << successes.size() << "/" << relays.size() << " relays" << endl;

    return successes.empty() ? EXIT_UNREACHABLE : EXIT_OK;
}
} // namespace

int main(int argc, char** argv)
{
    CommandLine args;
    CLI::App app{ "Hydrates a local record store from Nostr relays", "relay-hydrator" };
    app.require_subcommand(1);
    app.add_option("-c,--config", args.configPath, "Path to a YAML configuration file");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");

    auto* backfill = app.add_subcommand("backfill", "Fetch matching events from relays and store them");
    backfill->add_option("-k,--kind", args.kinds, "Event kind to fetch");
    backfill->add_option("-a,--author", args.authors, "Hex pubkey of an author to fetch");
    backfill->add_option("--since", args.since, "Only events newer than this unix timestamp");
    backfill->add_option("--until", args.until, "Only events older than this unix timestamp");
    backfill->add_option("-l,--limit", args.limit, "Maximum number of events per relay")->check(CLI::PositiveNumber);
    backfill->add_option("-r,--relay", args.relays, "Relay to query instead of the default relays");

    auto* subscribe = app.add_subcommand("subscribe", "Store matching events as they are published, until interrupted");
    subscribe->add_option("-k,--kind", args.kinds, "Event kind to subscribe to");
    subscribe->add_option("-a,--author", args.authors, "Hex pubkey of an author to subscribe to");
    subscribe->add_option("--since", args.since, "Only events newer than this unix timestamp");
    subscribe->add_option("-r,--relay", args.relays, "Relay to subscribe to instead of the local relay")->expected(1);

    auto* verify = app.add_subcommand("verify", "Check the ID and signature of an event stored in a JSON file");
    verify->add_option("event", args.eventFile, "Path to the event JSON file")->required()->check(CLI::ExistingFile);

    auto* publish = app.add_subcommand("publish", "Sign an event with the configured key and publish it");
    publish->add_option("-k,--kind", args.publishKind, "Kind of the event");
    publish->add_option("content", args.content, "Content of the event")->required();
    publish->add_option("-t,--tag", args.tags, "Tag of the form name=value");
    publish->add_option("-r,--relay", args.relays, "Relay to publish to instead of the default relays");

    CLI11_PARSE(app, argc, argv);

    auto appender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    internal::initLogging(appender);

    try
    {
        config::Config config = args.configPath.empty()
            ? config::loadFromString("")
            : config::loadFromFile(args.configPath);

        plog::get()->setMaxSeverity(args.verbose ? plog::debug : plog::severityFromString(config.logLevel.c_str()));

        if (backfill->parsed())
        {
            return runBackfill(appender, config, args);
        }
        if (subscribe->parsed())
        {
            return runSubscribe(appender, config, args);
        }
        if (verify->parsed())
        {
            return runVerify(appender, args);
        }
        if (publish->parsed())
        {
            return runPublish(appender, config, args);
        }
    }
    catch (const ConfigError& ce)
    {
        PLOG_ERROR << "Configuration error: " << ce.what();
        return EXIT_CONFIG;
    }
    catch (const invalid_argument& ia)
    {
        PLOG_ERROR << "Invalid arguments: " << ia.what();
        return EXIT_CONFIG;
    }
    catch (const StoreError& se)
    {
        PLOG_ERROR << "Record store error: " << se.what();
        return EXIT_UNREACHABLE;
    }

    return EXIT_OK;
}
