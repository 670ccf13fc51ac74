#include <gtest/gtest.h>

#include "data/kinds.hpp"
#include "errors.hpp"
#include "service/record_mapper.hpp"
#include "fake_relay.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace std;
using namespace ::testing;

namespace hydrator_test
{
const string testRelay = "wss://relay.example.com";

TEST(RecordMapperTest, MapArticle_ReadsMetadataTags)
{
    Event event = makeEvent(1, LONGFORM);
    event.tags = {
        { "d", "my-article" },
        { "title", "My Article" },
        { "summary", "A summary" },
        { "image", "https://example.com/cover.png" },
        { "published_at", "1690000000" },
        { "t", "nostr" },
        { "t", "c++" }
    };

    DomainRecord record = mapRecord(event, testRelay);

    ASSERT_TRUE(holds_alternative<Article>(record));
    const Article& article = get<Article>(record);
    ASSERT_EQ(article.eventId, event.id);
    ASSERT_EQ(article.pubkey, event.pubkey);
    ASSERT_EQ(article.kind, LONGFORM);
    ASSERT_EQ(article.sourceRelay, testRelay);
    ASSERT_EQ(article.slug, "my-article");
    ASSERT_EQ(article.title, "My Article");
    ASSERT_EQ(article.summary, "A summary");
    ASSERT_EQ(article.image, "https://example.com/cover.png");
    ASSERT_EQ(article.publishedAt, 1690000000);
    ASSERT_EQ(article.topics, vector<string>({ "nostr", "c++" }));
    ASSERT_EQ(article.sig, event.sig);
}

TEST(RecordMapperTest, MapArticle_KeepsFirstOccurrence_OfSingleValuedTags)
{
    Event event = makeEvent(1, LONGFORM_DRAFT);
    event.tags = { { "title", "First" }, { "title", "Second" } };

    Article article = mapArticle(event, testRelay);

    ASSERT_EQ(article.title, "First");
}

TEST(RecordMapperTest, MapArticle_LeavesMissingFieldsEmpty)
{
    Event event = makeEvent(1, LONGFORM);

    Article article = mapArticle(event, testRelay);

    ASSERT_TRUE(article.slug.empty());
    ASSERT_TRUE(article.title.empty());
    ASSERT_EQ(article.publishedAt, 0);
    ASSERT_TRUE(article.topics.empty());
}

TEST(RecordMapperTest, MapComment_SeparatesRootAndParentReferences)
{
    string articleCoordinate = "30023:" + hexId(7) + ":my-article";
    Event event = makeEvent(2, COMMENT);
    event.tags = {
        { "A", articleCoordinate, testRelay },
        { "K", "30023" },
        { "P", hexId(7) },
        { "e", hexId(3), testRelay, hexId(8) },
        { "k", "1111" },
        { "p", hexId(8) }
    };

    DomainRecord record = mapRecord(event, testRelay);

    ASSERT_TRUE(holds_alternative<Comment>(record));
    const Comment& comment = get<Comment>(record);
    ASSERT_EQ(comment.rootAddress, articleCoordinate);
    ASSERT_EQ(comment.rootKind, 30023);
    ASSERT_EQ(comment.rootPubkey, hexId(7));
    ASSERT_TRUE(comment.rootEventId.empty());
    ASSERT_EQ(comment.parentEventId, hexId(3));
    ASSERT_EQ(comment.parentKind, 1111);
    ASSERT_EQ(comment.parentPubkey, hexId(8));
    ASSERT_TRUE(comment.parentAddress.empty());
}

TEST(RecordMapperTest, MapComment_LeavesUnreferencedKindsUnset)
{
    Event event = makeEvent(2, COMMENT);
    event.tags = { { "E", hexId(3) } };

    Comment comment = mapComment(event, testRelay);

    ASSERT_EQ(comment.rootEventId, hexId(3));
    ASSERT_LT(comment.rootKind, 0);
    ASSERT_LT(comment.parentKind, 0);
}

TEST(RecordMapperTest, MapHighlight_ReadsSourceReferences)
{
    Event event = makeEvent(3, HIGHLIGHT);
    event.content = "A memorable sentence.";
    event.tags = {
        { "a", "30023:" + hexId(7) + ":my-article" },
        { "e", hexId(4) },
        { "r", "https://example.com/post" },
        { "context", "The paragraph around a memorable sentence." }
    };

    DomainRecord record = mapRecord(event, testRelay);

    ASSERT_TRUE(holds_alternative<Highlight>(record));
    const Highlight& highlight = get<Highlight>(record);
    ASSERT_EQ(highlight.content, "A memorable sentence.");
    ASSERT_EQ(highlight.articleCoordinate, "30023:" + hexId(7) + ":my-article");
    ASSERT_EQ(highlight.sourceEventId, hexId(4));
    ASSERT_EQ(highlight.sourceUrl, "https://example.com/post");
    ASSERT_EQ(highlight.context, "The paragraph around a memorable sentence.");
}

TEST(RecordMapperTest, MapHighlight_Throws_WithoutContent)
{
    Event event = makeEvent(3, HIGHLIGHT);
    event.content.clear();

    ASSERT_THROW(mapRecord(event, testRelay), InvalidEventError);
}

TEST(RecordMapperTest, MapMedia_ReadsUrlFromTags)
{
    Event event = makeEvent(4, PICTURE);
    event.tags = {
        { "title", "Sunset" },
        { "url", "https://example.com/sunset.jpg" },
        { "m", "image/jpeg" },
        { "t", "photography" }
    };

    DomainRecord record = mapRecord(event, testRelay);

    ASSERT_TRUE(holds_alternative<Media>(record));
    const Media& media = get<Media>(record);
    ASSERT_EQ(media.url, "https://example.com/sunset.jpg");
    ASSERT_EQ(media.title, "Sunset");
    ASSERT_EQ(media.mimeType, "image/jpeg");
    ASSERT_EQ(media.hashtags, vector<string>({ "photography" }));
    ASSERT_FALSE(media.nsfw);
}

TEST(RecordMapperTest, MapMedia_FallsBackToContentUrl)
{
    Event event = makeEvent(5, VIDEO);
    event.content = "https://example.com/clip.mp4";

    Media media = mapMedia(event, testRelay);

    ASSERT_EQ(media.url, "https://example.com/clip.mp4");
}

TEST(RecordMapperTest, MapMedia_IgnoresContentThatIsNotAUrl)
{
    Event event = makeEvent(5, SHORT_VIDEO);
    event.content = "Look at this!";

    Media media = mapMedia(event, testRelay);

    ASSERT_TRUE(media.url.empty());
}

TEST(RecordMapperTest, MapMedia_FlagsSensitiveContent)
{
    Event warned = makeEvent(6, PICTURE);
    warned.tags = { { "content-warning" } };
    Event labeled = makeEvent(7, PICTURE);
    labeled.tags = { { "L", "NSFW" } };
    Event tagged = makeEvent(8, PICTURE);
    tagged.tags = { { "t", "Adult" } };

    ASSERT_TRUE(mapMedia(warned, testRelay).nsfw);
    ASSERT_TRUE(mapMedia(labeled, testRelay).nsfw);
    ASSERT_TRUE(mapMedia(tagged, testRelay).nsfw);
}

TEST(RecordMapperTest, MapRecord_StoresOtherKindsVerbatim)
{
    Event event = makeEvent(9, TEXT_NOTE);
    event.tags = { { "p", hexId(1) }, { "custom", "value", "extra" } };

    DomainRecord record = mapRecord(event, testRelay);

    ASSERT_TRUE(holds_alternative<GenericEvent>(record));
    const GenericEvent& generic = get<GenericEvent>(record);
    ASSERT_EQ(generic.tags, event.tags);
    ASSERT_EQ(generic.content, event.content);
    ASSERT_EQ(generic.sig, event.sig);
    ASSERT_EQ(recordType(record), "event");
}

TEST(RecordMapperTest, MapRecord_IsPure)
{
    Event event = makeEvent(10, LONGFORM);
    event.tags = { { "d", "slug" }, { "t", "one" } };

    DomainRecord first = mapRecord(event, testRelay);
    DomainRecord second = mapRecord(event, testRelay);

    ASSERT_EQ(recordToJson(first), recordToJson(second));
}
} // namespace hydrator_test
