#include <gtest/gtest.h>

#include "data/tags.hpp"

using namespace hydrator::data;
using namespace std;
using namespace ::testing;

namespace hydrator_test
{
TEST(TagsTest, ParseTag_RecognizesArticleMetadata)
{
    Tag tag = parseTag({ "d", "my-article" });
    auto identifier = get_if<IdentifierTag>(&tag);
    ASSERT_NE(identifier, nullptr);
    ASSERT_EQ(identifier->value, "my-article");

    Tag published = parseTag({ "published_at", "1700000000" });
    ASSERT_TRUE(holds_alternative<PublishedAtTag>(published));
    ASSERT_EQ(get<PublishedAtTag>(published).timestamp, 1700000000);

    ASSERT_TRUE(holds_alternative<TitleTag>(parseTag({ "title", "Title" })));
    ASSERT_TRUE(holds_alternative<SummaryTag>(parseTag({ "summary", "Summary" })));
    ASSERT_TRUE(holds_alternative<ImageTag>(parseTag({ "image", "https://example.com/a.png" })));
    ASSERT_TRUE(holds_alternative<TopicTag>(parseTag({ "t", "nostr" })));
}

TEST(TagsTest, ParseTag_DistinguishesRootFromParentScope)
{
    Tag root = parseTag({ "E", "abcd", "wss://relay.example.com" });
    Tag parent = parseTag({ "e", "ef01" });

    ASSERT_EQ(get<EventReferenceTag>(root).scope, Scope::Root);
    ASSERT_EQ(get<EventReferenceTag>(root).relayHint, "wss://relay.example.com");
    ASSERT_EQ(get<EventReferenceTag>(parent).scope, Scope::Parent);
    ASSERT_TRUE(get<EventReferenceTag>(parent).relayHint.empty());

    ASSERT_EQ(get<AddressReferenceTag>(parseTag({ "A", "30023:pk:slug" })).scope, Scope::Root);
    ASSERT_EQ(get<PubkeyReferenceTag>(parseTag({ "p", "pk" })).scope, Scope::Parent);
}

TEST(TagsTest, ParseTag_ParsesKindReferences)
{
    Tag kind = parseTag({ "K", "30023" });

    ASSERT_TRUE(holds_alternative<KindReferenceTag>(kind));
    ASSERT_EQ(get<KindReferenceTag>(kind).kind, 30023);
    ASSERT_EQ(get<KindReferenceTag>(kind).scope, Scope::Root);
}

TEST(TagsTest, ParseTag_KeepsMalformedKnownTagsAsUnknown)
{
    ASSERT_TRUE(holds_alternative<UnknownTag>(parseTag({ "k", "not-a-number" })));
    ASSERT_TRUE(holds_alternative<UnknownTag>(parseTag({ "k", "70000" })));
    ASSERT_TRUE(holds_alternative<UnknownTag>(parseTag({ "published_at", "soon" })));
    ASSERT_TRUE(holds_alternative<UnknownTag>(parseTag({ "d" })));
    ASSERT_TRUE(holds_alternative<UnknownTag>(parseTag({})));
}

TEST(TagsTest, ParseTag_AcceptsContentWarningWithoutReason)
{
    Tag warning = parseTag({ "content-warning" });

    ASSERT_TRUE(holds_alternative<ContentWarningTag>(warning));
    ASSERT_TRUE(get<ContentWarningTag>(warning).reason.empty());
}

TEST(TagsTest, ParseTag_PreservesUnknownTagsVerbatim)
{
    vector<string> raw = { "zap", "pk", "wss://relay.example.com", "1" };

    Tag tag = parseTag(raw);

    ASSERT_TRUE(holds_alternative<UnknownTag>(tag));
    ASSERT_EQ(get<UnknownTag>(tag).raw, raw);
}

TEST(TagsTest, ParseTags_PreservesOrder)
{
    auto tags = parseTags({ { "t", "first" }, { "d", "slug" }, { "t", "second" } });

    ASSERT_EQ(tags.size(), 3);
    ASSERT_EQ(get<TopicTag>(tags[0]).value, "first");
    ASSERT_EQ(get<IdentifierTag>(tags[1]).value, "slug");
    ASSERT_EQ(get<TopicTag>(tags[2]).value, "second");
}
} // namespace hydrator_test
