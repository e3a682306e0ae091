#include <plog/Init.h>
#include <plog/Log.h>

#include "cryptography/signature_verifier.hpp"
#include "hex.hpp"
#include "noscrypt_context.hpp"
#include "../internal/logging.hpp"

using namespace std;
using namespace nip98::cryptography;
using namespace nip98::data;

NoscryptVerifier::NoscryptVerifier(shared_ptr<plog::IAppender> appender)
{
    nip98::internal::initLogging(appender);

    this->_noscryptContext = createNoscryptContext();
};

bool NoscryptVerifier::verify(const Event& event) const
{
    NCPublicKey pubkey;
    if (!fromHex(event.pubkey, pubkey.key, sizeof(pubkey.key)))
    {
        PLOG_DEBUG << "Signature verification failed - the pubkey is not 32 bytes of hex.";
        return false;
    }

    uint8_t signature[64];
    if (!fromHex(event.sig, signature, sizeof(signature)))
    {
        PLOG_DEBUG << "Signature verification failed - the signature is not 64 bytes of hex.";
        return false;
    }

    string id = event.generateId();
    if (!event.id.empty() && event.id != id)
    {
        PLOG_DEBUG << "Signature verification failed - the event ID does not match the event data.";
        return false;
    }

    uint8_t digest[32];
    fromHex(id, digest, sizeof(digest));

    NCResult verifyResult = NCVerifyDigest(
        this->_noscryptContext.get(),
        &pubkey,
        digest,
        signature
    );

    if (verifyResult != NC_SUCCESS)
    {
        PLOG_DEBUG << "Signature verification failed - the signature does not match the pubkey.";
        return false;
    }

    return true;
};
