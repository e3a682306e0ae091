#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "signer/signer.hpp"

namespace nip98
{
namespace signer
{
/**
 * @brief An ordered list of known signing capabilities, probed once at startup to select the one
 * a `SignerSession` will use.
 */
class SignerRegistry
{
public:
    SignerRegistry(std::shared_ptr<plog::IAppender> appender);

    SignerRegistry(
        std::shared_ptr<plog::IAppender> appender,
        std::vector<std::shared_ptr<ISigner>> signers);

    /**
     * @brief Adds a capability to the end of the probe order.
     */
    void registerSigner(std::shared_ptr<ISigner> signer);

    /**
     * @brief Finds the first registered capability that is currently available.
     * @returns The selected capability, or `nullptr` if none is available.
     */
    std::shared_ptr<ISigner> detect() const;

    /**
     * @brief Lists the names of all registered capabilities that are currently available, in
     * probe order.
     */
    std::vector<std::string> availableSigners() const;

private:
    ///< A mutex to protect the instance properties.
    mutable std::mutex _propertyMutex;

    ///< Capabilities in the order they are probed.
    std::vector<std::shared_ptr<ISigner>> _signers;

    std::vector<std::shared_ptr<ISigner>> _snapshot() const;
};
} // namespace signer
} // namespace nip98
