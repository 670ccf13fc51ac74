#pragma once

#include <ctime>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace hydrator
{
namespace data
{
/**
 * @brief Fields shared by every projected record.
 * @remark `eventId` is the primary key of every record type.
 */
struct RecordBase
{
    std::string eventId;
    std::string pubkey;
    int kind = 0;
    std::time_t createdAt = 0;
    std::string content;
    std::string sourceRelay; ///< The relay from which the event was first received.
};

/**
 * @brief A long-form article or draft (kinds 30023, 30024).
 */
struct Article : RecordBase
{
    std::string slug;
    std::string title;
    std::string summary;
    std::string image;
    std::time_t publishedAt = 0;
    std::vector<std::string> topics;
    std::string sig;
};

/**
 * @brief A comment (kind 1111).
 * @remark Root references come from uppercase tags, parent references from lowercase tags.
 * Unset kinds are negative.
 */
struct Comment : RecordBase
{
    std::string rootAddress;
    std::string rootEventId;
    int rootKind = -1;
    std::string rootPubkey;
    std::string parentAddress;
    std::string parentEventId;
    int parentKind = -1;
    std::string parentPubkey;
};

/**
 * @brief A highlighted passage (kind 9802).
 */
struct Highlight : RecordBase
{
    std::string articleCoordinate;
    std::string sourceEventId;
    std::string sourceUrl;
    std::string context;
};

/**
 * @brief A picture or video post (kinds 20, 21, 22).
 */
struct Media : RecordBase
{
    std::string url;
    std::string title;
    std::string mimeType;
    std::vector<std::string> hashtags;
    bool nsfw = false;
};

/**
 * @brief Any other event, stored verbatim.
 */
struct GenericEvent : RecordBase
{
    std::vector<std::vector<std::string>> tags;
    std::string sig;
};

using DomainRecord = std::variant<Article, Comment, Highlight, Media, GenericEvent>;

/**
 * @brief Returns the fields common to every record type.
 */
const RecordBase& header(const DomainRecord& record);

/**
 * @brief Returns the persisted type name of the record, e.g. "article".
 */
std::string recordType(const DomainRecord& record);

/**
 * @brief Serializes the type-specific fields of the record to a JSON object.
 */
nlohmann::json recordToJson(const DomainRecord& record);

/**
 * @brief Rebuilds a record from its persisted type name and JSON payload.
 * @throws `std::invalid_argument` if the type name is unknown.
 * @throws `nlohmann::json::exception` if the payload does not match the type.
 */
DomainRecord recordFromJson(const std::string& type, const nlohmann::json& j);
} // namespace data
} // namespace hydrator
