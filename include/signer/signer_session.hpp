#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "auth_error.hpp"
#include "data/data.hpp"
#include "signer/signer.hpp"

namespace nip98
{
namespace signer
{
/**
 * @brief A snapshot of the connection to a signing capability.
 * @remark `pubkey` is only set while `connected` is true.
 */
struct SessionState
{
    bool connected = false;
    std::optional<std::string> pubkey;
    std::optional<std::string> signerName;
};

/**
 * @brief Describes the capability behind a session.
 */
struct SignerInfo
{
    std::string name;
    std::vector<int> nips;
};

/**
 * @brief Tracks whether a signing capability is connected and which public key it controls.
 * @remark The session starts disconnected.  Only `connect`, `disconnect`, and the detection of a
 * lost capability during `sign` change its state.  State readers receive a copy of an immutable
 * snapshot.
 */
class SignerSession
{
public:
    /**
     * @param appender The log appender.
     * @param signer The capability selected at startup, or `nullptr` if none was found.
     */
    SignerSession(std::shared_ptr<plog::IAppender> appender, std::shared_ptr<ISigner> signer);

    /**
     * @brief Indicates whether a signing capability is currently reachable, regardless of the
     * connection state.
     */
    bool isAvailable() const;

    /**
     * @brief Requests the public key from the capability and marks the session connected.
     * @returns The hex-encoded public key.
     * @throws `AuthException` with `NoSignerAvailable` if no capability is reachable, or
     * `SignerRejected` if the capability declines, returns an empty key, or the session is
     * disconnected while the capability is answering.
     * @remark Blocks until the capability answers.  A `disconnect` issued meanwhile wins.
     */
    std::string connect();

    /**
     * @brief Returns the session to the disconnected state.  Safe to call repeatedly.
     */
    void disconnect();

    SessionState currentState() const;

    /**
     * @brief Asks the capability to sign an event template.
     * @returns The signed event.
     * @throws `AuthException` with `NotConnected` if `connect` has not succeeded, in which case the
     * capability is never invoked; `NoSignerAvailable` if the capability has gone away, in which
     * case the session is disconnected; or `SigningFailed` if the capability fails.
     * @remark Blocks until the capability answers.  Calling this again may prompt the user again.
     */
    std::shared_ptr<data::Event> sign(std::shared_ptr<data::Event> event);

    /**
     * @brief Describes the capability behind the session.
     * @throws `AuthException` with `NoSignerAvailable` if no capability is reachable.
     */
    SignerInfo signerInfo() const;

    /**
     * @brief Sets the single handler that is invoked with the new state after every state change.
     * @remark Replaces any previously set handler.  Pass an empty function to clear it.
     */
    void setStateChangedHandler(std::function<void(const SessionState&)> handler);

private:
    ///< The capability used to sign events.
    std::shared_ptr<ISigner> _signer;

    ///< A mutex to protect the instance properties.
    mutable std::mutex _propertyMutex;

    ///< The current state snapshot.  Replaced, never modified in place.
    std::shared_ptr<const SessionState> _state;

    std::function<void(const SessionState&)> _stateChangedHandler;

    ///< Advanced on every transition to disconnected.
    std::uint64_t _generation = 0;

    /**
     * @brief Replaces the state snapshot and notifies the state handler.
     * @param expectedGeneration When set, the update is dropped if the session has been
     * disconnected since this generation was read.
     * @returns False if the update was dropped.
     */
    bool _updateState(SessionState state, std::optional<std::uint64_t> expectedGeneration = std::nullopt);

    std::uint64_t _currentGeneration() const;

    std::optional<std::string> _signerName() const;
};
} // namespace signer
} // namespace nip98
