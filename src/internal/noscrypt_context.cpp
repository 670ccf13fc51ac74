#include <cstdint>
#include <stdexcept>

#include "noscrypt_context.hpp"
#include "noscrypt_logger.hpp"
#include "../cryptography/secure_rng.hpp"

using namespace std;
using namespace hydrator::cryptography;

static void ncFreeContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
}

shared_ptr<NCContext> hydrator::internal::initNoscryptContext()
{
    // The context struct is opaque and its size is only known at runtime.
    void* ctxMemory = operator new(NCGetContextStructSize());
    shared_ptr<NCContext> ctx(static_cast<NCContext*>(ctxMemory), ncFreeContext);

    uint8_t randomEntropy[NC_CONTEXT_ENTROPY_SIZE];
    SecureRng::fill(randomEntropy, sizeof(randomEntropy));

    NCResult initResult = NCInitContext(ctx.get(), randomEntropy);
    SecureRng::zero(randomEntropy, sizeof(randomEntropy));

    if (initResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(initResult);
        throw runtime_error("initNoscryptContext: Failed to initialize the noscrypt context.");
    }

    return ctx;
};
