#include <stdexcept>

#include "data/records.hpp"

using namespace hydrator::data;
using namespace nlohmann;
using namespace std;

namespace
{
void writeBase(json& j, const RecordBase& base)
{
    j["event_id"] = base.eventId;
    j["pubkey"] = base.pubkey;
    j["kind"] = base.kind;
    j["created_at"] = base.createdAt;
    j["content"] = base.content;
    j["source_relay"] = base.sourceRelay;
}

void readBase(const json& j, RecordBase& base)
{
    base.eventId = j.at("event_id").get<string>();
    base.pubkey = j.at("pubkey").get<string>();
    base.kind = j.at("kind").get<int>();
    base.createdAt = j.at("created_at").get<time_t>();
    base.content = j.at("content").get<string>();
    base.sourceRelay = j.value("source_relay", string());
}

json toJson(const Article& article)
{
    json j;
    writeBase(j, article);
    j["slug"] = article.slug;
    j["title"] = article.title;
    j["summary"] = article.summary;
    j["image"] = article.image;
    j["published_at"] = article.publishedAt;
    j["topics"] = article.topics;
    j["sig"] = article.sig;
    return j;
}

json toJson(const Comment& comment)
{
    json j;
    writeBase(j, comment);
    j["root_address"] = comment.rootAddress;
    j["root_event_id"] = comment.rootEventId;
    j["root_kind"] = comment.rootKind;
    j["root_pubkey"] = comment.rootPubkey;
    j["parent_address"] = comment.parentAddress;
    j["parent_event_id"] = comment.parentEventId;
    j["parent_kind"] = comment.parentKind;
    j["parent_pubkey"] = comment.parentPubkey;
    return j;
}

json toJson(const Highlight& highlight)
{
    json j;
    writeBase(j, highlight);
    j["article_coordinate"] = highlight.articleCoordinate;
    j["source_event_id"] = highlight.sourceEventId;
    j["source_url"] = highlight.sourceUrl;
    j["context"] = highlight.context;
    return j;
}

json toJson(const Media& media)
{
    json j;
    writeBase(j, media);
    j["url"] = media.url;
    j["title"] = media.title;
    j["mime_type"] = media.mimeType;
    j["hashtags"] = media.hashtags;
    j["nsfw"] = media.nsfw;
    return j;
}

json toJson(const GenericEvent& event)
{
    json j;
    writeBase(j, event);
    j["tags"] = event.tags;
    j["sig"] = event.sig;
    return j;
}
} // namespace

const RecordBase& hydrator::data::header(const DomainRecord& record)
{
    return visit([](const auto& r) -> const RecordBase& { return r; }, record);
};

string hydrator::data::recordType(const DomainRecord& record)
{
    switch (record.index())
    {
    case 0:
        return "article";
    case 1:
        return "comment";
    case 2:
        return "highlight";
    case 3:
        return "media";
    default:
        return "event";
    }
};

json hydrator::data::recordToJson(const DomainRecord& record)
{
    return visit([](const auto& r) { return toJson(r); }, record);
};

DomainRecord hydrator::data::recordFromJson(const string& type, const json& j)
{
    if (type == "article")
    {
        Article article;
        readBase(j, article);
        article.slug = j.at("slug").get<string>();
        article.title = j.at("title").get<string>();
        article.summary = j.at("summary").get<string>();
        article.image = j.at("image").get<string>();
        article.publishedAt = j.at("published_at").get<time_t>();
        article.topics = j.at("topics").get<vector<string>>();
        article.sig = j.at("sig").get<string>();
        return article;
    }
    if (type == "comment")
    {
        Comment comment;
        readBase(j, comment);
        comment.rootAddress = j.at("root_address").get<string>();
        comment.rootEventId = j.at("root_event_id").get<string>();
        comment.rootKind = j.at("root_kind").get<int>();
        comment.rootPubkey = j.at("root_pubkey").get<string>();
        comment.parentAddress = j.at("parent_address").get<string>();
        comment.parentEventId = j.at("parent_event_id").get<string>();
        comment.parentKind = j.at("parent_kind").get<int>();
        comment.parentPubkey = j.at("parent_pubkey").get<string>();
        return comment;
    }
    if (type == "highlight")
    {
        Highlight highlight;
        readBase(j, highlight);
        highlight.articleCoordinate = j.at("article_coordinate").get<string>();
        highlight.sourceEventId = j.at("source_event_id").get<string>();
        highlight.sourceUrl = j.at("source_url").get<string>();
        highlight.context = j.at("context").get<string>();
        return highlight;
    }
    if (type == "media")
    {
        Media media;
        readBase(j, media);
        media.url = j.at("url").get<string>();
        media.title = j.at("title").get<string>();
        media.mimeType = j.at("mime_type").get<string>();
        media.hashtags = j.at("hashtags").get<vector<string>>();
        media.nsfw = j.at("nsfw").get<bool>();
        return media;
    }
    if (type == "event")
    {
        GenericEvent event;
        readBase(j, event);
        event.tags = j.at("tags").get<vector<vector<string>>>();
        event.sig = j.at("sig").get<string>();
        return event;
    }

    throw invalid_argument("recordFromJson: Unknown record type " + type + ".");
};
