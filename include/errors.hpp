#pragma once

#include <stdexcept>
#include <string>

namespace hydrator
{
/**
 * @brief Thrown when a relay cannot be reached, the WebSocket handshake fails or times out, or
 * an open connection drops.
 * @remark Recoverable.  Callers skip the relay or retry it after a backoff.
 */
class ConnectionError : public std::runtime_error
{
public:
    explicit ConnectionError(const std::string& message) : std::runtime_error(message) { };
};

/**
 * @brief Thrown when a frame is sent on a connection that is not open.
 */
class NotConnectedError : public ConnectionError
{
public:
    explicit NotConnectedError(const std::string& message) : ConnectionError(message) { };
};

/**
 * @brief Thrown when a relay sends a frame that cannot be parsed.
 * @remark The offending frame is dropped; the read loop that encountered it continues.
 */
class ProtocolError : public std::runtime_error
{
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) { };
};

/**
 * @brief Thrown when an event is missing a required field or otherwise cannot be trusted.
 */
class InvalidEventError : public std::invalid_argument
{
public:
    explicit InvalidEventError(const std::string& message) : std::invalid_argument(message) { };
};

/**
 * @brief Thrown when an event's ID or signature does not match its contents.
 */
class VerificationError : public InvalidEventError
{
public:
    explicit VerificationError(const std::string& message) : InvalidEventError(message) { };
};

/**
 * @brief Thrown when the backing record store fails.
 */
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) { };
};

/**
 * @brief Thrown when the configuration is unusable, e.g. no relay is configured at all.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) { };
};
} // namespace hydrator
