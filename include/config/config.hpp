#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace hydrator
{
namespace config
{
/**
 * @brief Runtime settings of the hydrator.
 * @remark Every member has a usable default.  An empty `relays` list falls back to the public
 * relays unless the configuration explicitly lists no relays at all.
 */
struct Config
{
    std::string localRelay;
    std::vector<std::string> relays;
    bool relaysListed = false; ///< True if `relays.default` was present in the configuration.

    std::string storePath = "hydrator.db";

    std::chrono::seconds connectTimeout{ 10 };
    std::chrono::seconds perRelayTimeout{ 15 };
    std::chrono::seconds overallTimeout{ 30 };
    std::chrono::seconds receiveTimeout{ 5 };

    std::chrono::seconds backoff{ 5 };

    std::chrono::seconds poolMaxAge{ 300 };
    std::chrono::seconds cleanupInterval{ 60 };

    size_t batchSize = 50;

    std::string logLevel = "info";

    std::string secretKey; ///< Hex-encoded secret key used to sign published events.  Optional.

    /**
     * @brief Checks that the settings are usable together.
     * @throws `ConfigError` if no relay is configured, a timeout is not positive, the batch size
     * is zero, or the log level is unknown.
     */
    void validate() const;
};

/**
 * @brief Loads and validates a YAML configuration file.
 * @throws `ConfigError` if the file cannot be read or parsed, or its settings are invalid.
 */
Config loadFromFile(const std::string& path);

/**
 * @brief Loads and validates a YAML configuration document.
 * @throws `ConfigError` if the document cannot be parsed, or its settings are invalid.
 */
Config loadFromString(const std::string& yaml);
} // namespace config
} // namespace hydrator
