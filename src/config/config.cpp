#include <algorithm>

#include <plog/Severity.h>
#include <yaml-cpp/yaml.h>

#include "config/config.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::config;
using namespace std;

namespace
{
template <typename T>
T scalar(const YAML::Node& node, const string& key, const T& fallback)
{
    if (!node || !node[key])
    {
        return fallback;
    }

    try
    {
        return node[key].as<T>();
    }
    catch (const YAML::Exception& ye)
    {
        throw ConfigError("Invalid value for " + key + ": " + ye.what());
    }
}

chrono::seconds seconds(const YAML::Node& node, const string& key, chrono::seconds fallback)
{
    return chrono::seconds(scalar<long long>(node, key, fallback.count()));
}

Config fromYaml(const YAML::Node& root)
{
    Config config;
    if (!root || root.IsNull())
    {
        config.validate();
        return config;
    }
    if (!root.IsMap())
    {
        throw ConfigError("The configuration must be a YAML mapping.");
    }

    YAML::Node relays = root["relays"];
    if (relays)
    {
        config.localRelay = scalar<string>(relays, "local", config.localRelay);
        if (relays["default"])
        {
            config.relaysListed = true;
            config.relays = scalar<vector<string>>(relays, "default", config.relays);
        }
    }

    config.storePath = scalar<string>(root["store"], "path", config.storePath);

    YAML::Node timeouts = root["timeouts"];
    config.connectTimeout = seconds(timeouts, "connect", config.connectTimeout);
    config.perRelayTimeout = seconds(timeouts, "per_relay", config.perRelayTimeout);
    config.overallTimeout = seconds(timeouts, "overall", config.overallTimeout);
    config.receiveTimeout = seconds(timeouts, "receive", config.receiveTimeout);

    config.backoff = seconds(root["worker"], "backoff", config.backoff);

    YAML::Node pool = root["pool"];
    config.poolMaxAge = seconds(pool, "max_age", config.poolMaxAge);
    config.cleanupInterval = seconds(pool, "cleanup_interval", config.cleanupInterval);

    long long batchSize = scalar<long long>(root["hydration"], "batch_size", static_cast<long long>(config.batchSize));
    if (batchSize <= 0)
    {
        throw ConfigError("hydration.batch_size must be positive.");
    }
    config.batchSize = static_cast<size_t>(batchSize);

    config.logLevel = scalar<string>(root["log"], "level", config.logLevel);
    config.secretKey = scalar<string>(root["signer"], "secret_key", config.secretKey);

    config.validate();
    return config;
}
} // namespace

void Config::validate() const
{
    bool hasRelay = !this->localRelay.empty()
        || any_of(this->relays.begin(), this->relays.end(), [](const string& relay) { return !relay.empty(); });
    if (!hasRelay && this->relaysListed)
    {
        throw ConfigError("No relay is configured.  Set relays.local or list at least one relay in relays.default.");
    }

    for (auto timeout : { this->connectTimeout, this->perRelayTimeout, this->overallTimeout, this->receiveTimeout, this->backoff })
    {
        if (timeout.count() <= 0)
        {
            throw ConfigError("Timeouts and the worker backoff must be positive.");
        }
    }
    if (this->poolMaxAge.count() <= 0 || this->cleanupInterval.count() <= 0)
    {
        throw ConfigError("pool.max_age and pool.cleanup_interval must be positive.");
    }

    if (this->batchSize == 0)
    {
        throw ConfigError("hydration.batch_size must be positive.");
    }

    if (plog::severityFromString(this->logLevel.c_str()) == plog::none && this->logLevel != "none")
    {
        throw ConfigError("Unknown log level " + this->logLevel + ".");
    }
};

Config hydrator::config::loadFromFile(const string& path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& ye)
    {
        throw ConfigError("Failed to load configuration file " + path + ": " + ye.what());
    }

    return fromYaml(root);
};

Config hydrator::config::loadFromString(const string& yaml)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& ye)
    {
        throw ConfigError(string("Failed to parse configuration: ") + ye.what());
    }

    return fromYaml(root);
};
