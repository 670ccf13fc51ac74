#pragma once

#include <memory>

#include <noscrypt.h>
#include <plog/Log.h>

#include "data/data.hpp"

namespace hydrator
{
namespace cryptography
{
/**
 * @brief An interface for checking that an event is authentic.
 */
class IEventVerifier
{
public:
    virtual ~IEventVerifier() = default;

    /**
     * @brief Checks the ID and signature of the given event.
     * @returns True if the event ID matches the event contents and the signature over that ID is
     * valid for the event's pubkey, false otherwise.
     * @remark Malformed hex or wrong field lengths make the event invalid; they are never
     * reported as errors.  Implementations must be safe to call from multiple threads at once.
     */
    virtual bool verify(const data::Event& event) const = 0;
};

/**
 * @brief An `IEventVerifier` that checks BIP-340 Schnorr signatures with noscrypt.
 */
class NoscryptVerifier : public IEventVerifier
{
public:
    NoscryptVerifier(std::shared_ptr<plog::IAppender> appender);

    bool verify(const data::Event& event) const override;

private:
    std::shared_ptr<NCContext> _noscryptContext;
};
} // namespace cryptography
} // namespace hydrator
