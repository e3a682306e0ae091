#include <stdexcept>
#include <string>
#include <vector>

#include "noscrypt_context.hpp"
#include "nostr_secure_rng.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;

namespace nip98
{
namespace cryptography
{
static void _ncFreeContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
};

shared_ptr<NCContext> createNoscryptContext()
{
    /* Allocates a new unmanaged block of the size noscrypt reports, since the context
    * struct is opaque.  The block is destroyed and freed by the helper above when the
    * smart pointer is released.
    */
    void* ctxMemory = operator new(NCGetContextStructSize());
    NCContext* ctx = static_cast<NCContext*>(ctxMemory);

    vector<uint8_t> randomEntropy(NC_CONTEXT_ENTROPY_SIZE);
    NostrSecureRng::fill(randomEntropy);

    NCResult initResult = NCInitContext(ctx, randomEntropy.data());

    //Entropy is consumed by the context and must not linger in memory
    NostrSecureRng::zero(randomEntropy);

    if (initResult != NC_SUCCESS)
    {
        string reason = NC_LOG_ERROR(initResult);
        operator delete(ctxMemory);
        throw runtime_error("Failed to initialize the noscrypt context: " + reason);
    }

    return shared_ptr<NCContext>(ctx, _ncFreeContext);
};
} // namespace cryptography
} // namespace nip98
