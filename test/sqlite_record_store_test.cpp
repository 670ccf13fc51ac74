#include <cstdio>
#include <memory>

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "data/kinds.hpp"
#include "errors.hpp"
#include "service/record_mapper.hpp"
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
class SqliteRecordStoreTest : public testing::Test
{
public:
    inline static const string testRelay = "wss://relay.example.com";

    static DomainRecord testArticle(unsigned long long n)
    {
        Event event = makeEvent(n, LONGFORM);
        event.tags = { { "d", "article-" + to_string(n) }, { "title", "Article" }, { "t", "nostr" } };
        return mapRecord(event, testRelay);
    };

protected:
    shared_ptr<plog::ConsoleAppender<plog::TxtFormatter>> testAppender;
    shared_ptr<SqliteRecordStore> store;

    void SetUp() override
    {
        testAppender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
        store = make_shared<SqliteRecordStore>(testAppender, ":memory:");
    };
};

TEST_F(SqliteRecordStoreTest, Insert_StoresRecord_ThatCanBeFoundById)
{
    DomainRecord article = testArticle(1);

    ASSERT_TRUE(store->insert(article));

    auto found = store->findById(hexId(1));
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(holds_alternative<Article>(*found));
    ASSERT_EQ(get<Article>(*found).slug, "article-1");
    ASSERT_EQ(get<Article>(*found).topics, vector<string>({ "nostr" }));
    ASSERT_EQ(get<Article>(*found).sourceRelay, testRelay);
    ASSERT_EQ(recordToJson(*found), recordToJson(article));
};

TEST_F(SqliteRecordStoreTest, Insert_IgnoresDuplicateEventId)
{
    ASSERT_TRUE(store->insert(testArticle(1)));
    ASSERT_FALSE(store->insert(testArticle(1)));

    ASSERT_EQ(store->count(), 1);
};

TEST_F(SqliteRecordStoreTest, FindById_ReturnsNothing_ForUnknownEvent)
{
    ASSERT_FALSE(store->findById(hexId(42)).has_value());
};

TEST_F(SqliteRecordStoreTest, FindById_RestoresEveryRecordType)
{
    Event comment = makeEvent(2, COMMENT);
    comment.tags = { { "E", hexId(1) }, { "K", "30023" } };
    Event highlight = makeEvent(3, HIGHLIGHT);
    highlight.tags = { { "r", "https://example.com" } };
    Event media = makeEvent(4, PICTURE);
    media.tags = { { "url", "https://example.com/a.png" }, { "content-warning", "gore" } };
    Event note = makeEvent(5, TEXT_NOTE);
    note.tags = { { "p", hexId(9) } };

    for (const auto& event : { comment, highlight, media, note })
    {
        DomainRecord record = mapRecord(event, testRelay);
        ASSERT_TRUE(store->insert(record));

        auto found = store->findById(event.id);
        ASSERT_TRUE(found.has_value());
        ASSERT_EQ(found->index(), record.index());
        ASSERT_EQ(recordToJson(*found), recordToJson(record));
    }
};

TEST_F(SqliteRecordStoreTest, CountByKind_ReportsEveryRequestedKind)
{
    store->insert(testArticle(1));
    store->insert(testArticle(2));
    store->insert(mapRecord(makeEvent(3, TEXT_NOTE), testRelay));

    auto counts = store->countByKind({ LONGFORM, TEXT_NOTE, HIGHLIGHT });

    ASSERT_EQ(counts.at(LONGFORM), 2);
    ASSERT_EQ(counts.at(TEXT_NOTE), 1);
    ASSERT_EQ(counts.at(HIGHLIGHT), 0);
    ASSERT_EQ(store->count(), 3);
};

TEST_F(SqliteRecordStoreTest, Batch_CommitsOnFlush)
{
    store->beginBatch();
    store->beginBatch();
    store->insert(testArticle(1));
    store->insert(testArticle(2));
    store->flush();
    store->flush();

    ASSERT_EQ(store->count(), 2);
};

TEST_F(SqliteRecordStoreTest, Records_PersistAcrossReopen)
{
    string path = testing::TempDir() + "hydrator_store_test.db";
    remove(path.c_str());

    {
        SqliteRecordStore fileStore(testAppender, path);
        fileStore.beginBatch();
        fileStore.insert(testArticle(1));
        // The pending batch is committed when the store is closed.
    }

    {
        SqliteRecordStore fileStore(testAppender, path);
        ASSERT_EQ(fileStore.count(), 1);
        ASSERT_TRUE(fileStore.findById(hexId(1)).has_value());
    }

    remove(path.c_str());
    remove((path + "-wal").c_str());
    remove((path + "-shm").c_str());
};

TEST_F(SqliteRecordStoreTest, Batch_StaysOpen_WhenCommitFails)
{
    string path = testing::TempDir() + "hydrator_store_commit_test.db";
    remove(path.c_str());

    {
        SqliteRecordStore fileStore(testAppender, path);

        // Articles reference a guard row that only notes create, checked at commit time.
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        ASSERT_EQ(sqlite3_exec(db, R"SQL(
            CREATE TABLE guards (name TEXT PRIMARY KEY);
            CREATE TABLE guarded (name TEXT REFERENCES guards(name) DEFERRABLE INITIALLY DEFERRED);
            CREATE TRIGGER guard_articles AFTER INSERT ON records WHEN NEW.kind = 30023
            BEGIN
                INSERT INTO guarded VALUES ('guard');
            END;
            CREATE TRIGGER notes_create_guard AFTER INSERT ON records WHEN NEW.kind = 1
            BEGIN
                INSERT OR IGNORE INTO guards VALUES ('guard');
            END;
        )SQL", nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);

        fileStore.beginBatch();
        ASSERT_TRUE(fileStore.insert(testArticle(1)));
        ASSERT_THROW(fileStore.flush(), StoreError);

        ASSERT_NO_THROW(fileStore.beginBatch());
        ASSERT_TRUE(fileStore.insert(mapRecord(makeEvent(2, TEXT_NOTE), testRelay)));
        fileStore.flush();

        ASSERT_EQ(fileStore.count(), 2);
    }

    {
        SqliteRecordStore fileStore(testAppender, path);
        ASSERT_EQ(fileStore.count(), 2);
        ASSERT_TRUE(fileStore.findById(hexId(1)).has_value());
    }

    remove(path.c_str());
    remove((path + "-wal").c_str());
    remove((path + "-shm").c_str());
};

TEST_F(SqliteRecordStoreTest, Constructor_Throws_WhenDatabaseCannotBeOpened)
{
    ASSERT_THROW(SqliteRecordStore(testAppender, "/nonexistent-directory/hydrator.db"), StoreError);
};
} // namespace hydrator_test
