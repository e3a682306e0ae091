#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <plog/Init.h>
#include <plog/Log.h>

#include "auth_error.hpp"
#include "cryptography/signature_verifier.hpp"
#include "data/data.hpp"
#include "signer/signer_session.hpp"

namespace nip98
{
namespace service
{
/**
 * @brief Generates and validates NIP-98 HTTP auth tokens.
 * @remark A token is the base64 encoding of a signed kind 27235 event whose tags bind it to a
 * request URL, an HTTP method, and optionally a hash of the request body.  It may be prefixed
 * with the `Nostr ` authorization scheme.
 * @remark Validation is stateless and may be called concurrently.  It checks the structure and
 * bindings of the event; the signature itself is only checked when a signature verifier is
 * supplied.
 */
class AuthTokenService
{
public:
    typedef std::function<std::chrono::system_clock::time_point()> Clock;

    static constexpr int HTTP_AUTH_KIND = 27235; // Kind 27235 is reserved for NIP-98 events.

    inline static const std::string AUTHORIZATION_SCHEME = "Nostr ";

    /**
     * @param appender The log appender.
     * @param session The signer session used to sign tokens.  May be `nullptr` for a service that
     * only validates tokens.
     */
    AuthTokenService(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<signer::SignerSession> session);

    AuthTokenService(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<signer::SignerSession> session,
        data::AuthConfig config);

    /**
     * @param verifier An optional signature verifier consulted as the last validation step.
     * @param clock The source of the current time.  Defaults to the system clock.
     */
    AuthTokenService(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<signer::SignerSession> session,
        data::AuthConfig config,
        std::shared_ptr<cryptography::ISignatureVerifier> verifier,
        Clock clock = nullptr);

    const data::AuthConfig& config() const;

    /**
     * @brief Indicates whether tokens can be generated right now, i.e. a signing capability is
     * reachable and the session is connected to it.
     */
    bool isAvailable() const;

    /**
     * @brief Generates a NIP-98 token for a request.
     * @param url The absolute request URL.  It is bound as-is, with no normalization.
     * @param httpMethod The HTTP method, in any case.
     * @param options Whether to prefix the scheme, and the request body to bind.
     * @returns The token.
     * @throws `AuthException` with `NoSignerAvailable` or `NotConnected` if the session cannot
     * sign, or `TokenGenerationFailed` if signing or encoding fails.
     * @remark Blocks until the signer answers.
     */
    std::string getToken(
        const std::string& url,
        const std::string& httpMethod,
        const data::TokenOptions& options = data::TokenOptions());

    /**
     * @brief Generates a token prefixed with the `Nostr ` scheme, ready for an `Authorization`
     * header.
     * @throws `AuthException` as `getToken`.
     */
    std::string authorizationHeader(
        const std::string& url,
        const std::string& httpMethod,
        const std::optional<nlohmann::ordered_json>& payload = std::nullopt);

    /**
     * @brief Decodes the event carried by a token.
     * @throws `AuthException` with `MalformedToken` if the token is empty, is not base64, does not
     * decode to a JSON object, or the object lacks a required field.
     */
    data::Event unpackEventFromToken(const std::string& token) const;

    /**
     * @brief Validates a token against the request it accompanies.
     * @param token The token, with or without the `Nostr ` prefix.
     * @param url The request URL.  Must equal the bound URL exactly.
     * @param method The request method.  Compared case-insensitively.
     * @param body The request body.  The `payload` tag is only checked when this is a non-empty
     * object or array.
     * @returns True.  Every failure is reported by exception.
     * @throws `AuthException` with `MalformedToken`, `WrongEventKind`, `TokenExpired`,
     * `UrlMismatch`, `MethodMismatch`, `PayloadMismatch`, or `InvalidSignature`.
     */
    bool validateToken(
        const std::string& token,
        const std::string& url,
        const std::string& method,
        const std::optional<nlohmann::ordered_json>& body = std::nullopt) const;

    /**
     * @brief Validates a token as `validateToken`, reporting any failure as false.
     * @remark The failure reason is logged but not returned, so callers answering a network
     * request can respond with a generic "unauthorized".
     */
    bool isTokenAuthorized(
        const std::string& token,
        const std::string& url,
        const std::string& method,
        const std::optional<nlohmann::ordered_json>& body = std::nullopt) const;

    bool validateEventKind(const data::Event& event) const;

    /**
     * @brief Checks that the event is younger than the maximum event age, and not further in the
     * future than the allowed clock skew.
     */
    bool validateEventTimestamp(const data::Event& event) const;

    bool validateEventUrlTag(const data::Event& event, const std::string& url) const;

    bool validateEventMethodTag(const data::Event& event, const std::string& method) const;

    bool validateEventPayloadTag(const data::Event& event, const nlohmann::ordered_json& payload) const;

    /**
     * @brief Hashes a request body with the configured payload encoding.
     */
    std::string hashPayload(const nlohmann::ordered_json& payload) const;

    /**
     * @brief Wraps a token for client-side reuse, stamped with the current time.
     */
    data::AuthToken createTokenObject(const std::string& token, const data::Event& event) const;

    /**
     * @brief Indicates whether a cached token is still young enough to reuse.
     * @remark This measures the age of the cache record, not the age of the event.
     */
    bool isTokenValid(const data::AuthToken& tokenObject) const;

private:
    std::shared_ptr<signer::SignerSession> _session;

    std::shared_ptr<cryptography::ISignatureVerifier> _verifier;

    data::AuthConfig _config;

    Clock _clock;

    std::time_t _nowSeconds() const;

    /**
     * @brief Builds the unsigned event template for a request.
     */
    std::shared_ptr<data::Event> _buildEventTemplate(
        const std::string& url,
        const std::string& httpMethod,
        const std::optional<nlohmann::ordered_json>& payload) const;

    /**
     * @brief Runs every validation step against an unpacked event.
     * @throws `AuthException` for the first failed step.
     */
    void _validateEvent(
        const data::Event& event,
        const std::string& url,
        const std::string& method,
        const std::optional<nlohmann::ordered_json>& body) const;
};
} // namespace service
} // namespace nip98
