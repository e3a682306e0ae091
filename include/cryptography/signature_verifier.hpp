#pragma once

#include <memory>

#include <noscrypt.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include "data/data.hpp"

namespace nip98
{
namespace cryptography
{
/**
 * @brief Checks the cryptographic signature of a signed event.
 * @remark Token validation only checks the structure and bindings of an event.  Servers that
 * accept tokens from the network should compose a verifier into `AuthTokenService`.
 */
class ISignatureVerifier
{
public:
    virtual ~ISignatureVerifier() = default;

    /**
     * @brief Verifies that `sig` is a valid signature by `pubkey` over the event.
     * @returns True if the signature is valid, false otherwise.
     */
    virtual bool verify(const data::Event& event) const = 0;
};

/**
 * @brief Verifies BIP-340 Schnorr signatures over NIP-01 event IDs using noscrypt.
 */
class NoscryptVerifier : public ISignatureVerifier
{
public:
    NoscryptVerifier(std::shared_ptr<plog::IAppender> appender);

    /**
     * @remark The event ID is recomputed from the event data.  If the event carries an `id`, it
     * must equal the recomputed value.
     */
    bool verify(const data::Event& event) const override;

private:
    std::shared_ptr<NCContext> _noscryptContext;
};
} // namespace cryptography
} // namespace nip98
