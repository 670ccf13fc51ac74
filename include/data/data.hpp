#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace hydrator
{
namespace data
{
/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
*/
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = -1; ///< Event kind.  Negative until set.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event.
     * @throws `InvalidEventError` if the event object is invalid.
     * @remark The event ID is (re)generated from the event data as a side effect.
     */
    std::string serialize();

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `InvalidEventError` if the string is not JSON or a required field is missing.
     */
    static Event fromString(std::string jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @throws `InvalidEventError` if a required field is missing or has the wrong type.
     */
    static Event fromJson(nlohmann::json j);

    /**
     * @brief Computes the ID of an event with the given fields.
     * @returns The 32-byte lowercase hex-encoded sha256 of the canonical serialization
     * `[0, pubkey, created_at, kind, tags, content]`.
     * @remark This function is pure.  Identical input always yields the identical ID.
     */
    static std::string computeId(
        const std::string& pubkey,
        std::time_t createdAt,
        int kind,
        const std::vector<std::vector<std::string>>& tags,
        const std::string& content);

    /**
     * @brief Computes the ID this event should have, given its current fields.
     */
    std::string computeId() const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is empty for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;

private:
    /**
     * @brief Validates the event.
     * @throws `InvalidEventError` if the event object is invalid.
     * @remark The `createdAt` field defaults to the present if it is not already set.
     */
    void validate();

    /**
     * @brief Generates an ID for the event from its current fields and stores it in `id`.
     */
    void generateId();
};

/**
 * @brief A set of filters for querying Nostr relays.
 * @remark Only populated fields are sent to the relay.  At least one of `ids`, `authors`,
 * `kinds`, or `tags` must be set for a valid filter.  A `limit` of zero is not sent, which lets a
 * long-lived subscription receive every matching event.
 */
struct Filters
{
    std::vector<std::string> ids; ///< Event IDs.
    std::vector<std::string> authors; ///< Event author pubkeys, hex-encoded.
    std::vector<int> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag names mapped to lists of tag values.
    std::time_t since = 0; ///< Unix timestamp.  Matching events must be newer than this.
    std::time_t until = 0; ///< Unix timestamp.  Matching events must be older than this.
    int limit = 0; ///< The maximum number of events the relay should return on the initial query.

    /**
     * @brief Serializes the filters to a REQ message.
     * @param subscriptionId A string up to 64 chars in length that is unique per relay connection.
     * @returns A stringified JSON array of the form `["REQ", <subscriptionId>, <filters>]`.
     * @throws `std::invalid_argument` if the filter object is invalid.
     * @remarks The Nostr client is responsible for managing subscription IDs.  Responses from the
     * relay will be organized by subscription ID.
     */
    std::string serialize(const std::string& subscriptionId) const;

    /**
     * @brief Validates the filters.
     * @throws `std::invalid_argument` if the filter object is invalid.
     */
    void validate() const;
};
} // namespace data
} // namespace hydrator

namespace nlohmann
{
template <>
struct adl_serializer<hydrator::data::Event>
{
    static void to_json(json& j, const hydrator::data::Event& event);
    static void from_json(const json& j, hydrator::data::Event& event);
};

template <>
struct adl_serializer<hydrator::data::Filters>
{
    static void to_json(json& j, const hydrator::data::Filters& filters);
};
} // namespace nlohmann
