#pragma once

#include <memory>
#include <string>

#include "data/data.hpp"

namespace hydrator
{
namespace signer
{
/**
 * @brief An interface for Nostr event signing.
 */
class ISigner
{
public:
    virtual ~ISigner() = default;

    /**
     * @brief Signs the given Nostr event.
     * @param event The event to sign.
     * @throws `std::runtime_error` if the event cannot be signed.
     * @remark The event's `pubkey`, `id`, and `sig` fields are updated in-place.
     */
    virtual void sign(std::shared_ptr<data::Event> event) = 0;

    /**
     * @brief Gets the hex-encoded public key of the signing identity.
     */
    virtual std::string getPublicKey() const = 0;
};
} // namespace signer
} // namespace hydrator
