#include <atomic>
#include <memory>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "data/kinds.hpp"
#include "errors.hpp"
#include "service/event_projector.hpp"
#include "store/sqlite_record_store.hpp"
#include "fake_relay.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace hydrator::store;
using namespace std;
using namespace ::testing;

namespace hydrator_test
{
class MockRecordStore : public IRecordStore
{
public:
    MOCK_METHOD(optional<DomainRecord>, findById, (const string& eventId), (override));
    MOCK_METHOD(bool, insert, (const DomainRecord& record), (override));
    MOCK_METHOD(void, beginBatch, (), (override));
    MOCK_METHOD(void, flush, (), (override));
    MOCK_METHOD(long, count, (), (override));
    MOCK_METHOD((map<int, long>), countByKind, (const vector<int>& kinds), (override));
};

class EventProjectorTest : public testing::Test
{
public:
    inline static const string testRelay = "wss://relay.example.com";

protected:
    shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender;
    shared_ptr<SqliteRecordStore> store;
    shared_ptr<NiceMock<MockEventVerifier>> verifier;
    shared_ptr<EventProjector> projector;

    void SetUp() override
    {
        testAppender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
        store = make_shared<SqliteRecordStore>(testAppender, ":memory:");
        verifier = make_shared<NiceMock<MockEventVerifier>>();
        ON_CALL(*verifier, verify(_)).WillByDefault(Return(true));
        projector = make_shared<EventProjector>(testAppender, store, verifier);
    };
};

TEST_F(EventProjectorTest, Project_CreatesRecord_OnFirstSight)
{
    Event event = makeEvent(1, LONGFORM);
    event.tags = { { "d", "slug" } };

    Projection projection = projector->project(event, testRelay);

    ASSERT_TRUE(projection.created);
    ASSERT_TRUE(holds_alternative<Article>(projection.record));
    ASSERT_EQ(get<Article>(projection.record).slug, "slug");
    ASSERT_EQ(store->count(), 1);
};

TEST_F(EventProjectorTest, Project_ReturnsExistingRecord_OnRedelivery)
{
    Event event = makeEvent(1, LONGFORM);

    Projection first = projector->project(event, testRelay);
    Projection second = projector->project(event, "wss://other.example.com");

    ASSERT_TRUE(first.created);
    ASSERT_FALSE(second.created);
    ASSERT_EQ(header(second.record).sourceRelay, testRelay);
    ASSERT_EQ(store->count(), 1);
};

TEST_F(EventProjectorTest, Project_CreatesOneRecord_WhenProjectedConcurrently)
{
    Event event = makeEvent(1, HIGHLIGHT);
    atomic<int> created{ 0 };

    vector<thread> projectors;
    for (int i = 0; i < 8; i++)
    {
        projectors.emplace_back([this, &event, &created]()
        {
            if (projector->project(event, testRelay).created)
            {
                created++;
            }
        });
    }
    for (auto& t : projectors)
    {
        t.join();
    }

    ASSERT_EQ(created, 1);
    ASSERT_EQ(store->count(), 1);
};

TEST_F(EventProjectorTest, Project_Throws_WhenVerificationFails)
{
    Event event = makeEvent(1);
    EXPECT_CALL(*verifier, verify(_)).WillOnce(Return(false));

    ASSERT_THROW(projector->project(event, testRelay), VerificationError);
    ASSERT_EQ(store->count(), 0);
};

TEST_F(EventProjectorTest, Project_Throws_OnMalformedIdentity)
{
    Event shortId = makeEvent(1);
    shortId.id = "abcd";
    Event upperId = makeEvent(2);
    upperId.id = string(64, 'A');
    Event badPubkey = makeEvent(3);
    badPubkey.pubkey = "npub1xyz";
    Event badKind = makeEvent(4);
    badKind.kind = -1;

    ASSERT_THROW(projector->project(shortId, testRelay), InvalidEventError);
    ASSERT_THROW(projector->project(upperId, testRelay), InvalidEventError);
    ASSERT_THROW(projector->project(badPubkey, testRelay), InvalidEventError);
    ASSERT_THROW(projector->project(badKind, testRelay), InvalidEventError);
    ASSERT_EQ(store->count(), 0);
};

TEST_F(EventProjectorTest, Project_Throws_WhenEventCannotBeMapped)
{
    Event event = makeEvent(1, HIGHLIGHT);
    event.content.clear();

    ASSERT_THROW(projector->project(event, testRelay), InvalidEventError);
    ASSERT_EQ(store->count(), 0);
};

TEST_F(EventProjectorTest, Project_RereadsRecord_WhenInsertLosesRace)
{
    auto mockStore = make_shared<StrictMock<MockRecordStore>>();
    auto racingProjector = make_shared<EventProjector>(testAppender, mockStore, verifier);
    Event event = makeEvent(1, TEXT_NOTE);
    DomainRecord winner = mapGenericEvent(event, "wss://winner.example.com");

    EXPECT_CALL(*mockStore, findById(event.id))
        .WillOnce(Return(nullopt))
        .WillOnce(Return(winner));
    EXPECT_CALL(*mockStore, insert(_)).WillOnce(Return(false));

    Projection projection = racingProjector->project(event, testRelay);

    ASSERT_FALSE(projection.created);
    ASSERT_EQ(header(projection.record).sourceRelay, "wss://winner.example.com");
};

TEST_F(EventProjectorTest, Project_PropagatesStoreErrors)
{
    auto mockStore = make_shared<NiceMock<MockRecordStore>>();
    auto failingProjector = make_shared<EventProjector>(testAppender, mockStore, verifier);
    ON_CALL(*mockStore, findById(_)).WillByDefault(Throw(StoreError("database is locked")));

    ASSERT_THROW(failingProjector->project(makeEvent(1), testRelay), StoreError);
};

TEST_F(EventProjectorTest, Stats_CountsRecordsByKind)
{
    projector->project(makeEvent(1, LONGFORM), testRelay);
    projector->project(makeEvent(2, LONGFORM), testRelay);
    projector->project(makeEvent(3, COMMENT), testRelay);

    ProjectionStats stats = projector->stats({ LONGFORM, COMMENT, HIGHLIGHT });

    ASSERT_EQ(stats.total, 3);
    ASSERT_EQ(stats.byKind.at(LONGFORM), 2);
    ASSERT_EQ(stats.byKind.at(COMMENT), 1);
    ASSERT_EQ(stats.byKind.at(HIGHLIGHT), 0);
};
} // namespace hydrator_test
