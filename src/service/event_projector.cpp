#include <cctype>

#include "service/event_projector.hpp"
#include "service/record_mapper.hpp"
#include "errors.hpp"
#include "../internal/logging.hpp"

using namespace hydrator;
using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::service;
using namespace hydrator::store;
using namespace std;

namespace
{
bool isLowerHex(const string& value, size_t length)
{
    if (value.length() != length)
    {
        return false;
    }

    for (char c : value)
    {
        if (!isxdigit(static_cast<unsigned char>(c)) || isupper(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }

    return true;
}
} // namespace

EventProjector::EventProjector(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IRecordStore> store,
    shared_ptr<IEventVerifier> verifier)
{
    hydrator::internal::initLogging(appender);

    this->_store = store;
    this->_verifier = verifier;
};

Projection EventProjector::project(const Event& event, const string& sourceRelay)
{
    _validate(event);

    if (!this->_verifier->verify(event))
    {
        throw VerificationError("EventProjector::project: Event " + event.id + " failed verification.");
    }

    auto existing = this->_store->findById(event.id);
    if (existing.has_value())
    {
        PLOG_VERBOSE << "Event " << event.id << " already projected.";
        return Projection{ *existing, false };
    }

    DomainRecord record = mapRecord(event, sourceRelay);
    if (this->_store->insert(record))
    {
        PLOG_DEBUG << "Projected event " << event.id << " (kind " << event.kind << ") from relay "
                   << sourceRelay << " as " << recordType(record) << ".";
        return Projection{ record, true };
    }

    // Another projector stored the same event between the lookup and the insert.
    existing = this->_store->findById(event.id);
    if (!existing.has_value())
    {
        throw StoreError("EventProjector::project: Insert of event " + event.id + " was ignored but no record exists.");
    }

    return Projection{ *existing, false };
};

ProjectionStats EventProjector::stats(const vector<int>& kinds) const
{
    ProjectionStats stats;
    stats.total = this->_store->count();
    stats.byKind = this->_store->countByKind(kinds);
    return stats;
};

void EventProjector::_validate(const Event& event)
{
    if (!isLowerHex(event.id, 64))
    {
        throw InvalidEventError("EventProjector::project: Event ID must be 64 lowercase hex characters.");
    }
    if (!isLowerHex(event.pubkey, 64))
    {
        throw InvalidEventError("EventProjector::project: Event " + event.id + " has a malformed pubkey.");
    }
    if (event.kind < 0 || event.kind > 65535)
    {
        throw InvalidEventError("EventProjector::project: Event " + event.id + " has an invalid kind.");
    }
};
