#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "service/record_mapper.hpp"
#include "data/kinds.hpp"
#include "data/tags.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace std;

namespace
{
const unordered_set<string> nsfwTopics = { "nsfw", "adult", "explicit", "18+", "nsfl" };

template <typename Record>
Record withHeader(const Event& event, const string& sourceRelay)
{
    Record record;
    record.eventId = event.id;
    record.pubkey = event.pubkey;
    record.kind = event.kind;
    record.createdAt = event.createdAt;
    record.content = event.content;
    record.sourceRelay = sourceRelay;
    return record;
}

void setOnce(string& field, const string& value)
{
    if (field.empty())
    {
        field = value;
    }
}

string toLower(string value)
{
    transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return tolower(c); });
    return value;
}

bool isHttpUrl(const string& value)
{
    string lower = toLower(value);
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}
} // namespace

DomainRecord hydrator::service::mapRecord(const Event& event, const string& sourceRelay)
{
    if (isArticleKind(event.kind))
    {
        return mapArticle(event, sourceRelay);
    }
    if (isMediaKind(event.kind))
    {
        return mapMedia(event, sourceRelay);
    }

    switch (event.kind)
    {
    case COMMENT:
        return mapComment(event, sourceRelay);
    case HIGHLIGHT:
        return mapHighlight(event, sourceRelay);
    default:
        return mapGenericEvent(event, sourceRelay);
    }
};

Article hydrator::service::mapArticle(const Event& event, const string& sourceRelay)
{
    auto article = withHeader<Article>(event, sourceRelay);
    article.sig = event.sig;

    for (const auto& tag : parseTags(event.tags))
    {
        if (auto identifier = get_if<IdentifierTag>(&tag))
        {
            setOnce(article.slug, identifier->value);
        }
        else if (auto title = get_if<TitleTag>(&tag))
        {
            setOnce(article.title, title->value);
        }
        else if (auto summary = get_if<SummaryTag>(&tag))
        {
            setOnce(article.summary, summary->value);
        }
        else if (auto image = get_if<ImageTag>(&tag))
        {
            setOnce(article.image, image->url);
        }
        else if (auto publishedAt = get_if<PublishedAtTag>(&tag))
        {
            if (article.publishedAt == 0)
            {
                article.publishedAt = publishedAt->timestamp;
            }
        }
        else if (auto topic = get_if<TopicTag>(&tag))
        {
            if (!topic->value.empty())
            {
                article.topics.push_back(topic->value);
            }
        }
    }

    return article;
};

Comment hydrator::service::mapComment(const Event& event, const string& sourceRelay)
{
    auto comment = withHeader<Comment>(event, sourceRelay);

    for (const auto& tag : parseTags(event.tags))
    {
        if (auto address = get_if<AddressReferenceTag>(&tag))
        {
            setOnce(address->scope == Scope::Root ? comment.rootAddress : comment.parentAddress, address->coordinate);
        }
        else if (auto reference = get_if<EventReferenceTag>(&tag))
        {
            setOnce(reference->scope == Scope::Root ? comment.rootEventId : comment.parentEventId, reference->eventId);
        }
        else if (auto kind = get_if<KindReferenceTag>(&tag))
        {
            int& field = kind->scope == Scope::Root ? comment.rootKind : comment.parentKind;
            if (field < 0)
            {
                field = kind->kind;
            }
        }
        else if (auto pubkey = get_if<PubkeyReferenceTag>(&tag))
        {
            setOnce(pubkey->scope == Scope::Root ? comment.rootPubkey : comment.parentPubkey, pubkey->pubkey);
        }
    }

    return comment;
};

Highlight hydrator::service::mapHighlight(const Event& event, const string& sourceRelay)
{
    if (event.content.empty())
    {
        throw InvalidEventError("mapHighlight: Highlight " + event.id + " has no highlighted text.");
    }

    auto highlight = withHeader<Highlight>(event, sourceRelay);

    for (const auto& tag : parseTags(event.tags))
    {
        if (auto address = get_if<AddressReferenceTag>(&tag))
        {
            setOnce(highlight.articleCoordinate, address->coordinate);
        }
        else if (auto reference = get_if<EventReferenceTag>(&tag))
        {
            setOnce(highlight.sourceEventId, reference->eventId);
        }
        else if (auto web = get_if<WebReferenceTag>(&tag))
        {
            setOnce(highlight.sourceUrl, web->url);
        }
        else if (auto context = get_if<ContextTag>(&tag))
        {
            setOnce(highlight.context, context->value);
        }
    }

    return highlight;
};

Media hydrator::service::mapMedia(const Event& event, const string& sourceRelay)
{
    auto media = withHeader<Media>(event, sourceRelay);

    for (const auto& tag : parseTags(event.tags))
    {
        if (auto url = get_if<UrlTag>(&tag))
        {
            setOnce(media.url, url->url);
        }
        else if (auto image = get_if<ImageTag>(&tag))
        {
            setOnce(media.url, image->url);
        }
        else if (auto title = get_if<TitleTag>(&tag))
        {
            setOnce(media.title, title->value);
        }
        else if (auto mimeType = get_if<MimeTypeTag>(&tag))
        {
            setOnce(media.mimeType, mimeType->value);
        }
        else if (auto topic = get_if<TopicTag>(&tag))
        {
            media.hashtags.push_back(topic->value);
            if (nsfwTopics.count(toLower(topic->value)) > 0)
            {
                media.nsfw = true;
            }
        }
        else if (get_if<ContentWarningTag>(&tag))
        {
            media.nsfw = true;
        }
        else if (auto label = get_if<LabelNamespaceTag>(&tag))
        {
            if (toLower(label->value) == "nsfw")
            {
                media.nsfw = true;
            }
        }
    }

    if (media.url.empty() && isHttpUrl(event.content))
    {
        media.url = event.content;
    }

    return media;
};

GenericEvent hydrator::service::mapGenericEvent(const Event& event, const string& sourceRelay)
{
    auto generic = withHeader<GenericEvent>(event, sourceRelay);
    generic.tags = event.tags;
    generic.sig = event.sig;
    return generic;
};
