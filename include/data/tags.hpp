#pragma once

#include <ctime>
#include <string>
#include <variant>
#include <vector>

namespace hydrator
{
namespace data
{
/**
 * @brief Distinguishes uppercase (root) from lowercase (parent) reference tags.
 * @remark NIP-22 comments reference the root of a thread with uppercase tag names and the
 * immediate parent with lowercase tag names.
 */
enum class Scope
{
    Root,
    Parent
};

struct IdentifierTag { std::string value; }; ///< `d`
struct TitleTag { std::string value; }; ///< `title`
struct SummaryTag { std::string value; }; ///< `summary`
struct ImageTag { std::string url; }; ///< `image`
struct PublishedAtTag { std::time_t timestamp; }; ///< `published_at`
struct TopicTag { std::string value; }; ///< `t`
struct UrlTag { std::string url; }; ///< `url`
struct MimeTypeTag { std::string value; }; ///< `m`
struct ContextTag { std::string value; }; ///< `context`
struct ContentWarningTag { std::string reason; }; ///< `content-warning`
struct LabelNamespaceTag { std::string value; }; ///< `L`
struct WebReferenceTag { std::string url; }; ///< `r`

struct EventReferenceTag ///< `e` / `E`
{
    Scope scope;
    std::string eventId;
    std::string relayHint;
};

struct AddressReferenceTag ///< `a` / `A`
{
    Scope scope;
    std::string coordinate;
    std::string relayHint;
};

struct KindReferenceTag ///< `k` / `K`
{
    Scope scope;
    int kind;
};

struct PubkeyReferenceTag ///< `p` / `P`
{
    Scope scope;
    std::string pubkey;
    std::string relayHint;
};

/**
 * @brief Any tag the hydrator does not interpret, kept verbatim.
 */
struct UnknownTag
{
    std::vector<std::string> raw;
};

using Tag = std::variant<
    IdentifierTag,
    TitleTag,
    SummaryTag,
    ImageTag,
    PublishedAtTag,
    TopicTag,
    UrlTag,
    MimeTypeTag,
    ContextTag,
    ContentWarningTag,
    LabelNamespaceTag,
    WebReferenceTag,
    EventReferenceTag,
    AddressReferenceTag,
    KindReferenceTag,
    PubkeyReferenceTag,
    UnknownTag>;

/**
 * @brief Converts a raw tag array into its typed representation.
 * @remark A known tag name with a missing or malformed value becomes an `UnknownTag`, so
 * mapping code never sees a partially populated known tag.
 */
Tag parseTag(const std::vector<std::string>& raw);

/**
 * @brief Converts every tag of an event, preserving order.
 */
std::vector<Tag> parseTags(const std::vector<std::vector<std::string>>& tags);
} // namespace data
} // namespace hydrator
