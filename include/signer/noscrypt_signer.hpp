#pragma once

#include <plog/Init.h>
#include <plog/Log.h>
#include <noscrypt.h>

#include "signer/signer.hpp"

namespace nip98
{
namespace signer
{
/**
 * @brief A local keystore signing capability that signs events with noscrypt.
 * @remark The secret key is supplied by the caller; this class never generates or persists keys.
 * The key is zeroed when the signer is destroyed.
 */
class NoscryptSigner : public ISigner
{
public:
    /**
     * @param appender The log appender.
     * @param secretKeyHex The 32-byte secret key, hex-encoded.
     * @param name The name reported for the capability.
     * @remark If the secret key is malformed or invalid, the signer is constructed but reports
     * itself unavailable.
     */
    NoscryptSigner(
        std::shared_ptr<plog::IAppender> appender,
        const std::string& secretKeyHex,
        std::string name = "noscrypt");

    ~NoscryptSigner() override;

    std::string name() const override;

    bool isAvailable() const override;

    std::vector<int> supportedNips() const override;

    std::future<std::string> getPublicKey() override;

    std::future<std::shared_ptr<data::Event>> sign(std::shared_ptr<data::Event> event) override;

private:
    std::string _name;

    std::shared_ptr<NCContext> _noscryptContext;

    std::shared_ptr<NCSecretKey> _secretKey;

    ///< The x-only public key derived from `_secretKey`.
    std::shared_ptr<NCPublicKey> _publicKey;

    ///< Whether `_secretKey` is a valid secp256k1 secret key.
    bool _hasValidKey = false;

    inline std::string _getPublicKey() const;
};
} // namespace signer
} // namespace nip98
