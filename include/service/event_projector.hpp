#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "cryptography/event_verifier.hpp"
#include "data/data.hpp"
#include "data/records.hpp"
#include "store/record_store.hpp"

namespace hydrator
{
namespace service
{
/**
 * @brief The outcome of projecting one event.
 */
struct Projection
{
    data::DomainRecord record;
    bool created = false; ///< False if the record already existed.
};

struct ProjectionStats
{
    long total = 0;
    std::map<int, long> byKind;
};

/**
 * @brief Turns verified events into domain records, exactly once per event ID.
 * @remark The projector is the only writer of the record store.  Both bulk backfills and live
 * subscriptions go through it, so re-delivery is harmless however the event arrived.
 */
class EventProjector
{
public:
    EventProjector(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<store::IRecordStore> store,
        std::shared_ptr<cryptography::IEventVerifier> verifier);

    /**
     * @brief Projects the given event into a domain record.
     * @param event The event to project.
     * @param sourceRelay The relay from which the event was received.
     * @returns The new record, or the existing one if the event has been projected before.
     * @throws `InvalidEventError` if the ID, pubkey, or kind is missing or malformed, or the
     * event cannot be mapped.
     * @throws `VerificationError` if the ID or signature does not match the event.
     * @throws `StoreError` if the store fails.
     */
    Projection project(const data::Event& event, const std::string& sourceRelay);

    /**
     * @brief Counts projected records, in total and for each of the given kinds.
     */
    ProjectionStats stats(const std::vector<int>& kinds) const;

private:
    std::shared_ptr<store::IRecordStore> _store;
    std::shared_ptr<cryptography::IEventVerifier> _verifier;

    static void _validate(const data::Event& event);
};
} // namespace service
} // namespace hydrator
