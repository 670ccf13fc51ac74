#include <cstdint>
#include <stdexcept>

#include "signer/noscrypt_signer.hpp"
#include "../cryptography/secure_rng.hpp"
#include "../internal/hex.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_context.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace hydrator::cryptography;
using namespace hydrator::data;
using namespace hydrator::internal;
using namespace hydrator::signer;

#pragma region Constructors and Destructors

NoscryptSigner::NoscryptSigner(shared_ptr<plog::IAppender> appender, string secretKey)
{
    initLogging(appender);

    this->_noscryptContext = initNoscryptContext();
    this->_secretKey = make_unique<NCSecretKey>();
    this->_publicKey = make_unique<NCPublicKey>();

    if (secretKey.empty())
    {
        this->_generateSecretKey();
    }
    else
    {
        if (!fromHex(secretKey, this->_secretKey->key, sizeof(this->_secretKey->key)))
        {
            throw invalid_argument("NoscryptSigner::NoscryptSigner: The secret key must be 64 hex characters.");
        }

        NCResult validationResult = NCValidateSecretKey(this->_noscryptContext.get(), this->_secretKey.get());
        if (validationResult != NC_SUCCESS)
        {
            NC_LOG_ERROR(validationResult);
            throw invalid_argument("NoscryptSigner::NoscryptSigner: The secret key is not valid.");
        }
    }

    // Use noscrypt to derive the public key from its private counterpart.
    NCResult pubkeyResult = NCGetPublicKey(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        this->_publicKey.get());
    if (pubkeyResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(pubkeyResult);
        throw runtime_error("NoscryptSigner::NoscryptSigner: Failed to derive the public key.");
    }
};

NoscryptSigner::~NoscryptSigner()
{
    if (this->_secretKey)
    {
        SecureRng::zero(this->_secretKey.get(), sizeof(NCSecretKey));
    }
};

#pragma endregion

#pragma region Public Interface

void NoscryptSigner::sign(shared_ptr<Event> event)
{
    event->pubkey = this->getPublicKey();

    // Stamps the event ID as a side effect.
    event->serialize();

    uint8_t digest[32];
    if (!fromHex(event->id, digest, sizeof(digest)))
    {
        throw runtime_error("NoscryptSigner::sign: The event ID is not a 32-byte hex digest.");
    }

    uint8_t schnorrSig[64];
    uint8_t random32[32];

    // Secure random signing entropy is required.
    SecureRng::fill(random32, sizeof(random32));

    NCResult signatureResult = NCSignDigest(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        random32,
        digest,
        schnorrSig);

    // The random buffer could leak sensitive signing information.
    SecureRng::zero(random32, sizeof(random32));

    if (signatureResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(signatureResult);
        throw runtime_error("NoscryptSigner::sign: Failed to sign event " + event->id + ".");
    }

    event->sig = toHex(schnorrSig, sizeof(schnorrSig));
    PLOG_DEBUG << "Signed event " << event->id << ".";
};

string NoscryptSigner::getPublicKey() const
{
    return toHex(this->_publicKey->key, sizeof(this->_publicKey->key));
};

#pragma endregion

#pragma region Private Methods

void NoscryptSigner::_generateSecretKey()
{
    // Loop attempts to generate a secret key until a valid key is produced.
    // Limit the number of attempts to prevent resource exhaustion in the event of a failure.
    NCResult validationResult;
    int loopCount = 0;
    do
    {
        SecureRng::fill(this->_secretKey.get(), sizeof(NCSecretKey));
        validationResult = NCValidateSecretKey(this->_noscryptContext.get(), this->_secretKey.get());
    } while (validationResult != NC_SUCCESS && ++loopCount < 64);

    if (validationResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(validationResult);
        throw runtime_error("NoscryptSigner::_generateSecretKey: Failed to generate a valid secret key.");
    }
};

#pragma endregion
