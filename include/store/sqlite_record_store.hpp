#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <plog/Log.h>
#include <sqlite3.h>

#include "store/record_store.hpp"

namespace hydrator
{
namespace store
{
/**
 * @brief An `IRecordStore` backed by a single SQLite table.
 * @remark Pass ":memory:" as the path for a throwaway database.  One connection is shared by all
 * callers and serialized with a mutex.
 */
class SqliteRecordStore : public IRecordStore
{
public:
    /**
     * @throws `StoreError` if the database cannot be opened or its schema cannot be created.
     */
    SqliteRecordStore(std::shared_ptr<plog::IAppender> appender, const std::string& path);

    ~SqliteRecordStore();

    std::optional<data::DomainRecord> findById(const std::string& eventId) override;

    bool insert(const data::DomainRecord& record) override;

    void beginBatch() override;

    void flush() override;

    long count() override;

    std::map<int, long> countByKind(const std::vector<int>& kinds) override;

private:
    sqlite3* _db = nullptr;
    std::mutex _dbMutex;
    bool _inBatch = false;

    void _createSchema();

    void _exec(const char* sql);
};
} // namespace store
} // namespace hydrator
