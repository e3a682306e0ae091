#include <algorithm>
#include <exception>
#include <sstream>

#include "signer/signer_session.hpp"
#include "../internal/logging.hpp"

using namespace std;
using namespace nip98;
using namespace nip98::data;
using namespace nip98::signer;

SignerSession::SignerSession(shared_ptr<plog::IAppender> appender, shared_ptr<ISigner> signer)
: _signer(signer)
{
    nip98::internal::initLogging(appender);

    // A detected capability is named even before the user connects to it.
    SessionState initialState;
    initialState.signerName = this->_signerName();
    this->_state = make_shared<const SessionState>(initialState);

    if (initialState.signerName)
    {
        PLOG_INFO << "Detected signing capability " << *initialState.signerName << ".";
    }
    else
    {
        PLOG_INFO << "No signing capability was detected.";
    }
};

bool SignerSession::isAvailable() const
{
    return this->_signer != nullptr && this->_signer->isAvailable();
};

string SignerSession::connect()
{
    if (!this->isAvailable())
    {
        PLOG_ERROR << "Unable to connect - no signing capability is available.";
        throw AuthException(AuthError::NoSignerAvailable, "No signing capability is available.");
    }

    uint64_t generation = this->_currentGeneration();

    string pubkey;
    try
    {
        auto pubkeyFuture = this->_signer->getPublicKey();
        if (!pubkeyFuture.valid())
        {
            throw runtime_error("The signer returned no result.");
        }
        pubkey = pubkeyFuture.get();
    }
    catch (const exception& e)
    {
        ostringstream oss;
        oss << "Failed to connect to the signer: " << e.what();
        PLOG_ERROR << oss.str();
        throw AuthException(AuthError::SignerRejected, oss.str());
    }

    if (pubkey.empty())
    {
        PLOG_ERROR << "The signer did not provide a public key.";
        throw AuthException(AuthError::SignerRejected, "The signer did not provide a public key.");
    }

    SessionState connectedState;
    connectedState.connected = true;
    connectedState.pubkey = pubkey;
    connectedState.signerName = this->_signerName();
    if (!this->_updateState(connectedState, generation))
    {
        PLOG_WARNING << "The session was disconnected while waiting for the signer.";
        throw AuthException(AuthError::SignerRejected, "The session was disconnected while waiting for the signer.");
    }

    PLOG_INFO << "Connected to signer " << connectedState.signerName.value_or("(unnamed)") << ".";

    return pubkey;
};

void SignerSession::disconnect()
{
    SessionState disconnectedState;
    disconnectedState.signerName = this->_signerName();
    this->_updateState(disconnectedState);

    PLOG_INFO << "Disconnected from the signer.";
};

SessionState SignerSession::currentState() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return *this->_state;
};

shared_ptr<Event> SignerSession::sign(shared_ptr<Event> event)
{
    if (!this->currentState().connected)
    {
        throw AuthException(AuthError::NotConnected, "Not connected to a signer.  Please connect first.");
    }

    if (!this->isAvailable())
    {
        PLOG_WARNING << "The signing capability is no longer available - disconnecting.";
        this->disconnect();
        throw AuthException(AuthError::NoSignerAvailable, "The signing capability is no longer available.");
    }

    shared_ptr<Event> signedEvent;
    try
    {
        auto signingFuture = this->_signer->sign(event);
        if (!signingFuture.valid())
        {
            throw runtime_error("The signer returned no result.");
        }
        signedEvent = signingFuture.get();
    }
    catch (const exception& e)
    {
        ostringstream oss;
        oss << "Failed to sign event: " << e.what();
        PLOG_ERROR << oss.str();
        throw AuthException(AuthError::SigningFailed, oss.str());
    }

    if (signedEvent == nullptr)
    {
        PLOG_ERROR << "The signer returned an empty event.";
        throw AuthException(AuthError::SigningFailed, "Failed to sign event: the signer returned an empty event.");
    }

    return signedEvent;
};

SignerInfo SignerSession::signerInfo() const
{
    if (!this->isAvailable())
    {
        throw AuthException(AuthError::NoSignerAvailable, "No signing capability is available.");
    }

    SignerInfo info;
    info.name = this->_signer->name();

    // Every capability speaks NIP-01 events through a NIP-07 style interface and can sign NIP-98
    // auth events.
    info.nips = { 1, 7, 98 };
    for (int nip : this->_signer->supportedNips())
    {
        if (find(info.nips.begin(), info.nips.end(), nip) == info.nips.end())
        {
            info.nips.push_back(nip);
        }
    }
    sort(info.nips.begin(), info.nips.end());

    return info;
};

void SignerSession::setStateChangedHandler(function<void(const SessionState&)> handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_stateChangedHandler = handler;
};

bool SignerSession::_updateState(SessionState state, optional<uint64_t> expectedGeneration)
{
    function<void(const SessionState&)> handler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (expectedGeneration.has_value() && *expectedGeneration != this->_generation)
        {
            return false;
        }

        if (!state.connected)
        {
            this->_generation++;
        }

        this->_state = make_shared<const SessionState>(state);
        handler = this->_stateChangedHandler;
    }

    // The handler runs outside the lock so it may read the state again.
    if (handler)
    {
        handler(state);
    }

    return true;
};

uint64_t SignerSession::_currentGeneration() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_generation;
};

optional<string> SignerSession::_signerName() const
{
    if (!this->isAvailable())
    {
        return nullopt;
    }

    return this->_signer->name();
};
