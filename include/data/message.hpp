#pragma once

#include <memory>
#include <string>
#include <vector>

#include "data/data.hpp"

namespace hydrator
{
namespace data
{
/**
 * @brief The relay-to-client message types the hydrator understands.
 */
enum class FrameType
{
    EVENT,
    EOSE,
    NOTICE,
    OK,
    AUTH,
    CLOSED
};

/**
 * @brief A single message received from a relay.
 * @remark Only the members relevant to `type` are populated:
 * - `EVENT`: `subscriptionId`, `event`
 * - `EOSE`: `subscriptionId`
 * - `NOTICE`: `message`
 * - `OK`: `eventId`, `accepted`, `message`
 * - `AUTH`: `challenge`
 * - `CLOSED`: `subscriptionId`, `message`
 */
struct Frame
{
    FrameType type = FrameType::NOTICE;
    std::string subscriptionId;
    std::shared_ptr<Event> event;
    std::string eventId;
    bool accepted = false;
    std::string message;
    std::string challenge;

    /**
     * @brief Parses a raw WebSocket text payload received from a relay.
     * @throws `ProtocolError` if the payload is not a JSON array, its type is unknown, or a
     * positional member is missing or has the wrong type.
     */
    static Frame fromString(const std::string& payload);

    /**
     * @brief Gets the ID a reader waits on for this frame.
     * @returns The subscription ID of an EVENT, EOSE or CLOSED frame, the event ID of an OK
     * frame, or an empty string for NOTICE and AUTH frames, which concern the whole connection.
     */
    std::string target() const;
};

/**
 * @brief Returns the wire name of the given frame type, e.g. "EOSE".
 */
std::string toString(FrameType type);

/**
 * @brief Generates a REQ message carrying one or more filters.
 * @returns A stringified JSON array of the form `["REQ", <subscriptionId>, <filter>...]`.
 * @throws `std::invalid_argument` if no filters are given or any of them is invalid.
 */
std::string serializeRequest(const std::string& subscriptionId, const std::vector<Filters>& filters);

/**
 * @brief Generates a fresh subscription ID.
 * @returns A UUIDv4 string, well within the 64-character limit relays impose.
 */
std::string generateSubscriptionId();

/**
 * @brief Generates a message requesting a relay to close the subscription with the given ID.
 * @returns A stringified JSON array of the form `["CLOSE", <subscriptionId>]`.
 */
std::string serializeClose(const std::string& subscriptionId);

/**
 * @brief Generates a message publishing the given, already signed, event.
 * @returns A stringified JSON array of the form `["EVENT", <event>]`.
 */
std::string serializePublish(const Event& event);
} // namespace data
} // namespace hydrator
