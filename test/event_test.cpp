#include <gtest/gtest.h>

#include "data/data.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace std;
using namespace ::testing;

namespace hydrator_test
{
shared_ptr<Event> testEvent()
{
    auto event = make_shared<Event>();

    event->pubkey = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";
    event->createdAt = 1627846261;
    event->kind = 1;
    event->tags = {
        { "e", "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36", "wss://gitcitadel.nostr1.com" },
        { "p", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca" },
        { "a", "30023:f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca:abcd", "wss://gitcitadel.nostr1.com" }
    };
    event->content = "Hello, World!";

    return event;
}

TEST(EventTest, Equivalent_Events_Have_Same_ID)
{
    auto event1 = testEvent();
    auto event2 = testEvent();

    string serializedEvent1 = event1->serialize();
    string serializedEvent2 = event2->serialize();

    auto event1WithId = Event::fromString(serializedEvent1);
    auto event2WithId = Event::fromString(serializedEvent2);

    ASSERT_EQ(event1WithId.id, event2WithId.id);
    ASSERT_EQ(event1WithId.id.length(), 64);
}

TEST(EventTest, ComputeId_IsLowercaseHex_AndDeterministic)
{
    auto event = testEvent();

    string id = event->computeId();

    ASSERT_EQ(id, Event::computeId(event->pubkey, event->createdAt, event->kind, event->tags, event->content));
    ASSERT_EQ(id.length(), 64);
    for (char c : id)
    {
        ASSERT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
}

TEST(EventTest, ComputeId_Changes_WhenAnyHashedFieldChanges)
{
    auto event = testEvent();
    string original = event->computeId();

    auto changedContent = testEvent();
    changedContent->content = "Hello, World?";
    auto changedKind = testEvent();
    changedKind->kind = 2;
    auto changedCreatedAt = testEvent();
    changedCreatedAt->createdAt += 1;
    auto changedTags = testEvent();
    changedTags->tags.pop_back();

    ASSERT_NE(changedContent->computeId(), original);
    ASSERT_NE(changedKind->computeId(), original);
    ASSERT_NE(changedCreatedAt->computeId(), original);
    ASSERT_NE(changedTags->computeId(), original);
}

TEST(EventTest, ComputeId_IgnoresIdAndSignature)
{
    auto event = testEvent();
    string original = event->computeId();

    event->id = string(64, 'f');
    event->sig = string(128, 'e');

    ASSERT_EQ(event->computeId(), original);
}

TEST(EventTest, ComputeId_MatchesKnownDigest_OfCanonicalSerialization)
{
    // sha256 of [0,"f7234b...e9ca",1627846261,1,[["t","nostr"]],"Hello, World!"]
    string id = Event::computeId(
        "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca",
        1627846261,
        1,
        { { "t", "nostr" } },
        "Hello, World!");

    ASSERT_EQ(id, "331122813d663d723168d969aec8b27db625fd90b5239972426a0b4d055b83f4");
    ASSERT_EQ(Event::computeId("", 0, 1, {}, ""), "b9a2e34e404849f4881c68e0f6af8c3d042e2ed7f1e430706b5c010c49b87e98");
}

TEST(EventTest, FromString_RoundTripsEveryField)
{
    auto event = testEvent();
    event->sig = string(128, 'a');
    string serialized = event->serialize();

    Event parsed = Event::fromString(serialized);

    ASSERT_EQ(parsed.id, event->id);
    ASSERT_EQ(parsed.pubkey, event->pubkey);
    ASSERT_EQ(parsed.createdAt, event->createdAt);
    ASSERT_EQ(parsed.kind, event->kind);
    ASSERT_EQ(parsed.tags, event->tags);
    ASSERT_EQ(parsed.content, event->content);
    ASSERT_EQ(parsed.sig, event->sig);
}

TEST(EventTest, FromString_Throws_OnMalformedJson)
{
    ASSERT_THROW(Event::fromString("{\"id\": "), InvalidEventError);
}

TEST(EventTest, FromString_Throws_WhenFieldIsMissing)
{
    string noSig = R"({"id":"00","pubkey":"01","created_at":1,"kind":1,"tags":[],"content":""})";

    ASSERT_THROW(Event::fromString(noSig), InvalidEventError);
}

TEST(EventTest, FromString_Throws_WhenFieldHasWrongType)
{
    string stringKind = R"({"id":"00","pubkey":"01","created_at":1,"kind":"1","tags":[],"content":"","sig":""})";

    ASSERT_THROW(Event::fromString(stringKind), InvalidEventError);
}

TEST(EventTest, FromString_Throws_WhenNotAnObject)
{
    ASSERT_THROW(Event::fromString("[1, 2, 3]"), InvalidEventError);
}

TEST(EventTest, Serialize_Throws_WithoutPubkey)
{
    auto event = testEvent();
    event->pubkey.clear();

    ASSERT_THROW(event->serialize(), InvalidEventError);
}

TEST(EventTest, Serialize_Throws_WithOutOfRangeKind)
{
    auto event = testEvent();
    event->kind = 70000;

    ASSERT_THROW(event->serialize(), InvalidEventError);
}

TEST(EventTest, Equality_Throws_WhenIdIsMissing)
{
    auto event1 = testEvent();
    auto event2 = testEvent();
    event2->serialize();

    ASSERT_THROW((void)(*event1 == *event2), invalid_argument);
}

TEST(FiltersTest, Serialize_OmitsUnsetFields)
{
    Filters filters;
    filters.kinds = { 30023 };

    auto jarr = nlohmann::json::parse(filters.serialize("sub"));

    ASSERT_EQ(jarr[0], "REQ");
    ASSERT_EQ(jarr[1], "sub");
    ASSERT_EQ(jarr[2], nlohmann::json({ { "kinds", { 30023 } } }));
}

TEST(FiltersTest, Serialize_PrefixesTagFilters)
{
    Filters filters;
    filters.tags["t"] = { "nostr" };
    filters.since = 100;
    filters.until = 200;
    filters.limit = 10;

    auto jfilter = nlohmann::json::parse(filters.serialize("sub"))[2];

    ASSERT_EQ(jfilter["#t"], nlohmann::json({ "nostr" }));
    ASSERT_EQ(jfilter["since"], 100);
    ASSERT_EQ(jfilter["until"], 200);
    ASSERT_EQ(jfilter["limit"], 10);
}

TEST(FiltersTest, Validate_Throws_WithoutAnyCriteria)
{
    Filters filters;
    filters.limit = 10;

    ASSERT_THROW(filters.validate(), invalid_argument);
}

TEST(FiltersTest, Validate_Throws_WhenSinceIsAfterUntil)
{
    Filters filters;
    filters.kinds = { 1 };
    filters.since = 200;
    filters.until = 100;

    ASSERT_THROW(filters.validate(), invalid_argument);
}

TEST(FiltersTest, Validate_AcceptsUnsetLimit_ButNotNegative)
{
    Filters filters;
    filters.kinds = { 1111 };

    ASSERT_NO_THROW(filters.validate());
    ASSERT_FALSE(nlohmann::json::parse(filters.serialize("live"))[2].contains("limit"));

    filters.limit = -1;
    ASSERT_THROW(filters.validate(), invalid_argument);
}
} // namespace hydrator_test
