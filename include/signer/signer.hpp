#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "data/data.hpp"

namespace nip98
{
namespace signer
{
/**
 * @brief An interface for a signing capability, such as a browser extension bridge, a hardware
 * key, or a local keystore.
 * @remark The capability holds the private key material.  Requests to it may wait on user
 * interaction for an unbounded time, so callers that need a deadline must apply one to the
 * returned futures themselves.  A capability reports a refusal or failure by storing an exception
 * in the returned future.
 */
class ISigner
{
public:
    virtual ~ISigner() = default;

    /**
     * @brief Gets a human-readable name for the capability, e.g. `"nos2x"`.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Indicates whether the capability is currently reachable.
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Lists the NIPs the capability supports beyond NIP-01, NIP-07, and NIP-98.
     */
    virtual std::vector<int> supportedNips() const = 0;

    /**
     * @brief Requests the hex-encoded public key controlled by the capability.
     */
    virtual std::future<std::string> getPublicKey() = 0;

    /**
     * @brief Signs the given Nostr event.
     * @param event The unsigned event template.
     * @returns A future holding the signed event, with `pubkey`, `id`, and `sig` filled in.
     */
    virtual std::future<std::shared_ptr<data::Event>> sign(std::shared_ptr<data::Event> event) = 0;
};
} // namespace signer
} // namespace nip98
