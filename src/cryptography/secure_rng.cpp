#include <stdexcept>

#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "secure_rng.hpp"

using namespace std;
using namespace hydrator::cryptography;

void SecureRng::fill(void* buffer, size_t length)
{
    if (RAND_bytes(static_cast<uint8_t*>(buffer), static_cast<int>(length)) != 1)
    {
        PLOG_ERROR << "Failed to generate random bytes.";
        throw runtime_error("SecureRng::fill: Failed to generate random bytes.");
    }
};

void SecureRng::zero(void* buffer, size_t length)
{
    OPENSSL_cleanse(buffer, length);
};
