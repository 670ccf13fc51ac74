#include <unordered_set>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "data/message.hpp"
#include "errors.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace std;
using namespace ::testing;

using nlohmann::json;

namespace hydrator_test
{
class MessageTest : public testing::Test
{
public:
    static const json testEventJson()
    {
        return {
            { "id", string(64, 'a') },
            { "pubkey", string(64, 'b') },
            { "created_at", 1700000000 },
            { "kind", 30023 },
            { "tags", { { "d", "my-article" }, { "title", "My Article" } } },
            { "content", "Body text" },
            { "sig", string(128, 'c') }
        };
    };
};

TEST_F(MessageTest, FromString_ParsesEventFrame)
{
    string payload = json::array({ "EVENT", "sub-1", testEventJson() }).dump();

    Frame frame = Frame::fromString(payload);

    ASSERT_EQ(frame.type, FrameType::EVENT);
    ASSERT_EQ(frame.subscriptionId, "sub-1");
    ASSERT_NE(frame.event, nullptr);
    ASSERT_EQ(frame.event->id, string(64, 'a'));
    ASSERT_EQ(frame.event->kind, 30023);
    ASSERT_EQ(frame.event->tags.size(), 2);
    ASSERT_EQ(frame.event->content, "Body text");
};

TEST_F(MessageTest, FromString_ParsesEoseFrame)
{
    Frame frame = Frame::fromString(R"(["EOSE","sub-1"])");

    ASSERT_EQ(frame.type, FrameType::EOSE);
    ASSERT_EQ(frame.subscriptionId, "sub-1");
};

TEST_F(MessageTest, FromString_ParsesOkFrame)
{
    Frame accepted = Frame::fromString(R"(["OK","abcd",true,""])");
    Frame rejected = Frame::fromString(R"(["OK","abcd",false,"blocked: spam"])");

    ASSERT_EQ(accepted.type, FrameType::OK);
    ASSERT_EQ(accepted.eventId, "abcd");
    ASSERT_TRUE(accepted.accepted);
    ASSERT_FALSE(rejected.accepted);
    ASSERT_EQ(rejected.message, "blocked: spam");
};

TEST_F(MessageTest, FromString_ParsesNoticeAuthAndClosedFrames)
{
    Frame notice = Frame::fromString(R"(["NOTICE","rate limited"])");
    Frame auth = Frame::fromString(R"(["AUTH","challenge-string"])");
    Frame closed = Frame::fromString(R"(["CLOSED","sub-1","error: shutting down"])");

    ASSERT_EQ(notice.type, FrameType::NOTICE);
    ASSERT_EQ(notice.message, "rate limited");
    ASSERT_EQ(auth.type, FrameType::AUTH);
    ASSERT_EQ(auth.challenge, "challenge-string");
    ASSERT_EQ(closed.type, FrameType::CLOSED);
    ASSERT_EQ(closed.subscriptionId, "sub-1");
    ASSERT_EQ(closed.message, "error: shutting down");
};

TEST_F(MessageTest, FromString_AcceptsClosedFrame_WithoutMessage)
{
    Frame closed = Frame::fromString(R"(["CLOSED","sub-1"])");

    ASSERT_EQ(closed.type, FrameType::CLOSED);
    ASSERT_TRUE(closed.message.empty());
};

TEST_F(MessageTest, FromString_Throws_OnInvalidJson)
{
    ASSERT_THROW(Frame::fromString("[\"EVENT\", "), ProtocolError);
};

TEST_F(MessageTest, FromString_Throws_WhenPayloadIsNotAnArray)
{
    ASSERT_THROW(Frame::fromString(R"({"type":"EVENT"})"), ProtocolError);
    ASSERT_THROW(Frame::fromString("[]"), ProtocolError);
};

TEST_F(MessageTest, FromString_Throws_OnUnknownType)
{
    ASSERT_THROW(Frame::fromString(R"(["COUNT","sub-1",{"count":3}])"), ProtocolError);
};

TEST_F(MessageTest, FromString_Throws_WhenPositionalMemberIsMissing)
{
    ASSERT_THROW(Frame::fromString(R"(["EOSE"])"), ProtocolError);
    ASSERT_THROW(Frame::fromString(R"(["EVENT","sub-1"])"), ProtocolError);
    ASSERT_THROW(Frame::fromString(R"(["OK","abcd"])"), ProtocolError);
};

TEST_F(MessageTest, FromString_Throws_OnMalformedEvent)
{
    json event = testEventJson();
    event.erase("sig");
    string payload = json::array({ "EVENT", "sub-1", event }).dump();

    ASSERT_THROW(Frame::fromString(payload), ProtocolError);
};

TEST_F(MessageTest, SerializeRequest_CarriesEveryFilter)
{
    Filters articles;
    articles.kinds = { 30023 };
    Filters comments;
    comments.kinds = { 1111 };
    comments.limit = 20;

    json jarr = json::parse(serializeRequest("sub-1", { articles, comments }));

    ASSERT_EQ(jarr.size(), 4);
    ASSERT_EQ(jarr[0], "REQ");
    ASSERT_EQ(jarr[1], "sub-1");
    ASSERT_EQ(jarr[2]["kinds"], json({ 30023 }));
    ASSERT_EQ(jarr[3]["limit"], 20);
};

TEST_F(MessageTest, SerializeRequest_Throws_WithoutFilters)
{
    ASSERT_THROW(serializeRequest("sub-1", {}), invalid_argument);
};

TEST_F(MessageTest, SerializeClose_ProducesCloseMessage)
{
    ASSERT_EQ(serializeClose("sub-1"), R"(["CLOSE","sub-1"])");
};

TEST_F(MessageTest, SerializePublish_WrapsEvent)
{
    Event event = testEventJson().get<Event>();

    json jarr = json::parse(serializePublish(event));

    ASSERT_EQ(jarr[0], "EVENT");
    ASSERT_EQ(jarr[1]["id"], event.id);
    ASSERT_EQ(jarr[1]["created_at"], 1700000000);
};

TEST_F(MessageTest, GenerateSubscriptionId_IsUniqueAndShort)
{
    unordered_set<string> ids;
    for (int i = 0; i < 100; i++)
    {
        string id = generateSubscriptionId();
        ASSERT_FALSE(id.empty());
        ASSERT_LE(id.length(), 64);
        ids.insert(id);
    }

    ASSERT_EQ(ids.size(), 100);
};

TEST_F(MessageTest, ToString_NamesEveryFrameType)
{
    ASSERT_EQ(toString(FrameType::EVENT), "EVENT");
    ASSERT_EQ(toString(FrameType::EOSE), "EOSE");
    ASSERT_EQ(toString(FrameType::CLOSED), "CLOSED");
};
TEST_F(MessageTest, Target_NamesSubscriptionOrEvent)
{
    ASSERT_EQ(Frame::fromString(R"(["EOSE","sub-1"])").target(), "sub-1");
    ASSERT_EQ(Frame::fromString(R"(["CLOSED","sub-2","error: shutting down"])").target(), "sub-2");
    ASSERT_EQ(Frame::fromString(R"(["OK","abcd",true,""])").target(), "abcd");
    ASSERT_EQ(Frame::fromString(R"(["NOTICE","hello"])").target(), "");
    ASSERT_EQ(Frame::fromString(R"(["AUTH","challenge"])").target(), "");
};
} // namespace hydrator_test
