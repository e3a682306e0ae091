#include <memory>
#include <stdexcept>

#include "signer/noscrypt_signer.hpp"
#include "../cryptography/hex.hpp"
#include "../cryptography/noscrypt_context.hpp"
#include "../cryptography/nostr_secure_rng.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace nip98::cryptography;
using namespace nip98::data;
using namespace nip98::signer;

#pragma region Constructors and Destructors

NoscryptSigner::NoscryptSigner(
    shared_ptr<plog::IAppender> appender,
    const string& secretKeyHex,
    string name)
: _name(name)
{
    nip98::internal::initLogging(appender);

    this->_noscryptContext = createNoscryptContext();
    this->_secretKey = make_shared<NCSecretKey>();
    this->_publicKey = make_shared<NCPublicKey>();

    if (!fromHex(secretKeyHex, this->_secretKey->key, sizeof(this->_secretKey->key)))
    {
        PLOG_ERROR << "The secret key must be 32 bytes of hex - the signer is unavailable.";
        return;
    }

    NCResult secretValidationResult = NCValidateSecretKey(this->_noscryptContext.get(), this->_secretKey.get());
    if (secretValidationResult != NC_SUCCESS)
    {
        PLOG_ERROR << "The secret key is not valid ("
                   << nip98::internal::describeNoscryptError(secretValidationResult, __func__, __LINE__)
                   << ") - the signer is unavailable.";
        return;
    }

    // Use noscrypt to derive the public key from its private counterpart.
    NCResult pubkeyGenerationResult = NCGetPublicKey(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        this->_publicKey.get());
    if (pubkeyGenerationResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(pubkeyGenerationResult);
        PLOG_ERROR << "Unable to derive the public key - the signer is unavailable.";
        return;
    }

    this->_hasValidKey = true;
};

NoscryptSigner::~NoscryptSigner()
{
    NostrSecureRng::zero(this->_secretKey.get(), sizeof(NCSecretKey));
};

#pragma endregion

#pragma region Public Interface

string NoscryptSigner::name() const { return this->_name; };

bool NoscryptSigner::isAvailable() const { return this->_hasValidKey; };

vector<int> NoscryptSigner::supportedNips() const { return {}; };

future<string> NoscryptSigner::getPublicKey()
{
    promise<string> pubkeyPromise;

    if (!this->_hasValidKey)
    {
        pubkeyPromise.set_exception(make_exception_ptr(
            runtime_error("The signer does not hold a valid secret key.")));
    }
    else
    {
        pubkeyPromise.set_value(this->_getPublicKey());
    }

    return pubkeyPromise.get_future();
};

future<shared_ptr<Event>> NoscryptSigner::sign(shared_ptr<Event> event)
{
    promise<shared_ptr<Event>> signingPromise;

    if (!this->_hasValidKey)
    {
        signingPromise.set_exception(make_exception_ptr(
            runtime_error("The signer does not hold a valid secret key.")));
        return signingPromise.get_future();
    }

    if (event == nullptr)
    {
        signingPromise.set_exception(make_exception_ptr(
            invalid_argument("No event was provided to sign.")));
        return signingPromise.get_future();
    }

    // The template is left untouched; the signed copy is returned.
    auto signedEvent = make_shared<Event>(*event);
    signedEvent->pubkey = this->_getPublicKey();
    signedEvent->id = signedEvent->generateId();

    uint8_t digest[32];
    fromHex(signedEvent->id, digest, sizeof(digest));

    uint8_t schnorrSig[64];
    uint8_t random32[32];

    //Secure random signing entropy is required
    NostrSecureRng::fill(random32, sizeof(random32));

    NCResult signatureResult = NCSignDigest(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        random32,
        digest,
        schnorrSig
    );

    //Random buffer could leak sensitive signing information
    NostrSecureRng::zero(random32, sizeof(random32));

    if (signatureResult != NC_SUCCESS)
    {
        string reason = NC_LOG_ERROR(signatureResult);
        signingPromise.set_exception(make_exception_ptr(
            runtime_error("Failed to sign the event: " + reason)));
        return signingPromise.get_future();
    }

    signedEvent->sig = toHex(schnorrSig, sizeof(schnorrSig));
    signingPromise.set_value(signedEvent);

    return signingPromise.get_future();
};

#pragma endregion

#pragma region Private Accessors

inline string NoscryptSigner::_getPublicKey() const
{
    return toHex(this->_publicKey->key, sizeof(this->_publicKey->key));
};

#pragma endregion
