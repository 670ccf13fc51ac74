#include <cstdint>

#include <noscrypt.h>

#include "cryptography/event_verifier.hpp"
#include "../internal/hex.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_context.hpp"

using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::internal;
using namespace nlohmann;
using namespace std;

NoscryptVerifier::NoscryptVerifier(shared_ptr<plog::IAppender> appender)
{
    initLogging(appender);

    this->_noscryptContext = initNoscryptContext();
};

bool NoscryptVerifier::verify(const Event& event) const
{
    string expectedId;
    try
    {
        expectedId = event.computeId();
    }
    catch (const json::exception& je)
    {
        // Content that cannot be serialized canonically, e.g. invalid UTF-8.
        PLOG_VERBOSE << "Event " << event.id << " cannot be serialized: " << je.what();
        return false;
    }

    if (expectedId != event.id)
    {
        PLOG_VERBOSE << "Event " << event.id << " does not match its computed ID " << expectedId << ".";
        return false;
    }

    uint8_t digest[32];
    NCPublicKey pubkey;
    uint8_t sig[64];

    if (!fromHex(event.id, digest, sizeof(digest))
        || !fromHex(event.pubkey, pubkey.key, sizeof(pubkey.key))
        || !fromHex(event.sig, sig, sizeof(sig)))
    {
        PLOG_VERBOSE << "Event " << event.id << " has a malformed pubkey or signature.";
        return false;
    }

    NCResult result = NCVerifyDigest(this->_noscryptContext.get(), &pubkey, digest, sig);
    if (result != NC_SUCCESS)
    {
        PLOG_VERBOSE << "Event " << event.id << " has an invalid signature.";
        return false;
    }

    return true;
};
