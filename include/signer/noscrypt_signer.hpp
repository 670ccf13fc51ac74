#pragma once

#include <memory>
#include <string>

#include <noscrypt.h>
#include <plog/Log.h>

#include "signer/signer.hpp"

namespace hydrator
{
namespace signer
{
/**
 * @brief An `ISigner` that holds a secret key locally and signs with noscrypt.
 */
class NoscryptSigner : public ISigner
{
public:
    /**
     * @param appender The plog appender used for log output.
     * @param secretKey A hex-encoded 32-byte secret key.  A fresh keypair is generated if empty.
     * @throws `std::invalid_argument` if the given secret key is malformed or invalid.
     */
    NoscryptSigner(std::shared_ptr<plog::IAppender> appender, std::string secretKey = "");

    ~NoscryptSigner();

    void sign(std::shared_ptr<data::Event> event) override;

    std::string getPublicKey() const override;

private:
    std::shared_ptr<NCContext> _noscryptContext;

    std::unique_ptr<NCSecretKey> _secretKey;

    std::unique_ptr<NCPublicKey> _publicKey;

    /**
     * @brief Generates a valid secret key from secure random bytes.
     */
    void _generateSecretKey();
};
} // namespace signer
} // namespace hydrator
