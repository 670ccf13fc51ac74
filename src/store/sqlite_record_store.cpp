#include <sstream>

#include <nlohmann/json.hpp>

#include "store/sqlite_record_store.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::data;
using namespace hydrator::store;
using namespace nlohmann;
using namespace std;

namespace
{
/**
 * @brief Finalizes the wrapped statement when it goes out of scope.
 */
struct Statement
{
    sqlite3_stmt* stmt = nullptr;

    ~Statement()
    {
        if (stmt)
        {
            sqlite3_finalize(stmt);
        }
    }
};

void checkSql(int rc, sqlite3* db, const char* what)
{
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW)
    {
        ostringstream oss;
        oss << what << " failed: " << sqlite3_errmsg(db) << " (rc=" << rc << ")";
        throw StoreError(oss.str());
    }
}

string columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : string();
}
} // namespace

SqliteRecordStore::SqliteRecordStore(shared_ptr<plog::IAppender> appender, const string& path)
{
    hydrator::internal::initLogging(appender);

    int rc = sqlite3_open(path.c_str(), &this->_db);
    if (rc != SQLITE_OK)
    {
        string message = this->_db ? sqlite3_errmsg(this->_db) : "out of memory";
        sqlite3_close(this->_db);
        this->_db = nullptr;
        throw StoreError("SqliteRecordStore: Failed to open database " + path + ": " + message);
    }

    try
    {
        this->_createSchema();
    }
    catch (const StoreError&)
    {
        sqlite3_close(this->_db);
        this->_db = nullptr;
        throw;
    }

    PLOG_INFO << "Opened record store " << path;
};

void SqliteRecordStore::_createSchema()
{
    this->_exec("PRAGMA journal_mode = WAL;");
    this->_exec("PRAGMA synchronous = NORMAL;");
    this->_exec("PRAGMA foreign_keys = ON;");
    this->_exec(R"SQL(
        CREATE TABLE IF NOT EXISTS records (
            event_id     TEXT PRIMARY KEY,
            record_type  TEXT NOT NULL,
            kind         INTEGER NOT NULL,
            pubkey       TEXT NOT NULL,
            created_at   INTEGER NOT NULL,
            source_relay TEXT,
            payload      TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS records_by_kind ON records(kind);
        CREATE INDEX IF NOT EXISTS records_by_pubkey ON records(pubkey);
    )SQL");
};

SqliteRecordStore::~SqliteRecordStore()
{
    if (this->_inBatch)
    {
        try
        {
            this->flush();
        }
        catch (const StoreError& se)
        {
            PLOG_ERROR << "Failed to commit pending records on close: " << se.what();
        }
    }

    if (this->_db)
    {
        sqlite3_close(this->_db);
    }
};

optional<DomainRecord> SqliteRecordStore::findById(const string& eventId)
{
    lock_guard<mutex> lock(this->_dbMutex);

    Statement st;
    checkSql(
        sqlite3_prepare_v2(this->_db, "SELECT record_type, payload FROM records WHERE event_id = ?;", -1, &st.stmt, nullptr),
        this->_db,
        "prepare findById");
    sqlite3_bind_text(st.stmt, 1, eventId.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(st.stmt);
    checkSql(rc, this->_db, "findById step");
    if (rc != SQLITE_ROW)
    {
        return nullopt;
    }

    string recordType = columnText(st.stmt, 0);
    string payload = columnText(st.stmt, 1);
    try
    {
        return recordFromJson(recordType, json::parse(payload));
    }
    catch (const json::exception& je)
    {
        throw StoreError("SqliteRecordStore::findById: Corrupt payload for event " + eventId + ": " + je.what());
    }
    catch (const invalid_argument& ia)
    {
        throw StoreError("SqliteRecordStore::findById: " + string(ia.what()));
    }
};

bool SqliteRecordStore::insert(const DomainRecord& record)
{
    const RecordBase& base = header(record);
    string recordType = data::recordType(record);
    string payload;
    try
    {
        payload = recordToJson(record).dump();
    }
    catch (const json::exception& je)
    {
        throw StoreError("SqliteRecordStore::insert: Cannot serialize record " + base.eventId + ": " + je.what());
    }

    lock_guard<mutex> lock(this->_dbMutex);

    Statement st;
    checkSql(
        sqlite3_prepare_v2(
            this->_db,
            "INSERT OR IGNORE INTO records(event_id, record_type, kind, pubkey, created_at, source_relay, payload) VALUES(?,?,?,?,?,?,?);",
            -1,
            &st.stmt,
            nullptr),
        this->_db,
        "prepare insert");
    sqlite3_bind_text(st.stmt, 1, base.eventId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 2, recordType.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st.stmt, 3, base.kind);
    sqlite3_bind_text(st.stmt, 4, base.pubkey.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.stmt, 5, static_cast<sqlite3_int64>(base.createdAt));
    sqlite3_bind_text(st.stmt, 6, base.sourceRelay.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 7, payload.c_str(), -1, SQLITE_TRANSIENT);
    checkSql(sqlite3_step(st.stmt), this->_db, "insert step");

    return sqlite3_changes(this->_db) > 0;
};

void SqliteRecordStore::beginBatch()
{
    lock_guard<mutex> lock(this->_dbMutex);
    if (this->_inBatch)
    {
        return;
    }

    this->_exec("BEGIN IMMEDIATE;");
    this->_inBatch = true;
};

void SqliteRecordStore::flush()
{
    lock_guard<mutex> lock(this->_dbMutex);
    if (!this->_inBatch)
    {
        return;
    }

    try
    {
        this->_exec("COMMIT;");
    }
    catch (const StoreError&)
    {
        // A failed COMMIT may leave the transaction open, in which case the batch stays pending.
        this->_inBatch = sqlite3_get_autocommit(this->_db) == 0;
        throw;
    }

    this->_inBatch = false;
    PLOG_DEBUG << "Committed record batch.";
};

long SqliteRecordStore::count()
{
    lock_guard<mutex> lock(this->_dbMutex);

    Statement st;
    checkSql(
        sqlite3_prepare_v2(this->_db, "SELECT COUNT(*) FROM records;", -1, &st.stmt, nullptr),
        this->_db,
        "prepare count");
    int rc = sqlite3_step(st.stmt);
    checkSql(rc, this->_db, "count step");

    return rc == SQLITE_ROW ? static_cast<long>(sqlite3_column_int64(st.stmt, 0)) : 0;
};

map<int, long> SqliteRecordStore::countByKind(const vector<int>& kinds)
{
    lock_guard<mutex> lock(this->_dbMutex);

    map<int, long> counts;
    for (int kind : kinds)
    {
        Statement st;
        checkSql(
            sqlite3_prepare_v2(this->_db, "SELECT COUNT(*) FROM records WHERE kind = ?;", -1, &st.stmt, nullptr),
            this->_db,
            "prepare countByKind");
        sqlite3_bind_int(st.stmt, 1, kind);
        int rc = sqlite3_step(st.stmt);
        checkSql(rc, this->_db, "countByKind step");

        counts[kind] = rc == SQLITE_ROW ? static_cast<long>(sqlite3_column_int64(st.stmt, 0)) : 0;
    }

    return counts;
};

void SqliteRecordStore::_exec(const char* sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(this->_db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SqliteRecordStore: SQL exec failed: " + message);
    }
};
