#include "signer/signer_registry.hpp"
#include "../internal/logging.hpp"

using namespace std;
using namespace nip98::signer;

SignerRegistry::SignerRegistry(shared_ptr<plog::IAppender> appender)
: SignerRegistry(appender, {}) { };

SignerRegistry::SignerRegistry(shared_ptr<plog::IAppender> appender, vector<shared_ptr<ISigner>> signers)
{
    nip98::internal::initLogging(appender);

    for (auto& signer : signers)
    {
        this->registerSigner(signer);
    }
};

void SignerRegistry::registerSigner(shared_ptr<ISigner> signer)
{
    if (signer == nullptr)
    {
        PLOG_WARNING << "Ignoring an attempt to register an empty signer.";
        return;
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_signers.push_back(signer);
};

shared_ptr<ISigner> SignerRegistry::detect() const
{
    auto signers = this->_snapshot();
    for (const auto& signer : signers)
    {
        if (signer->isAvailable())
        {
            PLOG_INFO << "Selected signing capability " << signer->name() << ".";
            return signer;
        }
    }

    PLOG_WARNING << "None of the " << signers.size() << " registered signing capabilities is available.";
    return nullptr;
};

vector<string> SignerRegistry::availableSigners() const
{
    vector<string> names;
    for (const auto& signer : this->_snapshot())
    {
        if (signer->isAvailable())
        {
            names.push_back(signer->name());
        }
    }

    return names;
};

vector<shared_ptr<ISigner>> SignerRegistry::_snapshot() const
{
    // Capabilities are probed on a copy, so a slow or reentrant probe never runs under the lock.
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_signers;
};
