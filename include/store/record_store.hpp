#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "data/records.hpp"

namespace hydrator
{
namespace store
{
/**
 * @brief Durable storage for projected records, keyed by event ID.
 * @remark The uniqueness of the event ID is enforced by the store itself, which makes it the
 * final arbiter when several projectors race to insert the same record.
 */
class IRecordStore
{
public:
    virtual ~IRecordStore() = default;

    /**
     * @brief Looks up the record projected from the given event.
     * @throws `StoreError` if the lookup fails.
     */
    virtual std::optional<data::DomainRecord> findById(const std::string& eventId) = 0;

    /**
     * @brief Inserts the record unless a record with the same event ID already exists.
     * @returns True if the record was inserted, false if it was ignored as a duplicate.
     * @throws `StoreError` if the insert fails.
     */
    virtual bool insert(const data::DomainRecord& record) = 0;

    /**
     * @brief Starts grouping writes so that they are committed together by `flush`.
     * @remark Does nothing if a batch is already open.
     */
    virtual void beginBatch() = 0;

    /**
     * @brief Commits the open batch, if any.
     * @throws `StoreError` if the commit fails.
     */
    virtual void flush() = 0;

    virtual long count() = 0;

    /**
     * @brief Counts records of each of the given kinds.
     * @returns A map with an entry, possibly zero, for every requested kind.
     */
    virtual std::map<int, long> countByKind(const std::vector<int>& kinds) = 0;
};
} // namespace store
} // namespace hydrator
