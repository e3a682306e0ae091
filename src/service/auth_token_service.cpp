#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "cryptography/base64.hpp"
#include "cryptography/payload_hasher.hpp"
#include "service/auth_token_service.hpp"
#include "../internal/logging.hpp"

using namespace std;
using namespace nip98;
using namespace nip98::cryptography;
using namespace nip98::data;
using namespace nip98::service;
using namespace nip98::signer;

using nlohmann::ordered_json;

static string _toUpper(string value)
{
    transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return toupper(c); });
    return value;
};

static string _toLower(string value)
{
    transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return tolower(c); });
    return value;
};

#pragma region Constructors

AuthTokenService::AuthTokenService(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<SignerSession> session)
: AuthTokenService(appender, session, AuthConfig()) { };

AuthTokenService::AuthTokenService(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<SignerSession> session,
    AuthConfig config)
: AuthTokenService(appender, session, config, nullptr) { };

AuthTokenService::AuthTokenService(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<SignerSession> session,
    AuthConfig config,
    shared_ptr<ISignatureVerifier> verifier,
    Clock clock)
: _session(session), _verifier(verifier), _config(config), _clock(clock)
{
    nip98::internal::initLogging(appender);

    if (!this->_clock)
    {
        this->_clock = []() { return chrono::system_clock::now(); };
    }

    if (this->_verifier == nullptr)
    {
        PLOG_DEBUG << "No signature verifier was provided - token signatures will not be checked.";
    }
};

#pragma endregion

#pragma region Token Generation

const AuthConfig& AuthTokenService::config() const { return this->_config; };

bool AuthTokenService::isAvailable() const
{
    return this->_session != nullptr
        && this->_session->isAvailable()
        && this->_session->currentState().connected;
};

string AuthTokenService::getToken(const string& url, const string& httpMethod, const TokenOptions& options)
{
    if (this->_session == nullptr || !this->_session->isAvailable())
    {
        throw AuthException(AuthError::NoSignerAvailable, "No signing capability is available.");
    }

    if (!this->_session->currentState().connected)
    {
        throw AuthException(AuthError::NotConnected, "Not connected to a signer.  Please connect first.");
    }

    try
    {
        auto eventTemplate = this->_buildEventTemplate(url, httpMethod, options.payload);
        auto signedEvent = this->_session->sign(eventTemplate);

        bool includeScheme = options.includeAuthorizationScheme.value_or(this->_config.includeAuthorizationScheme);
        string scheme = includeScheme ? AUTHORIZATION_SCHEME : string();

        return scheme + Base64::encode(signedEvent->serialize());
    }
    catch (const exception& e)
    {
        ostringstream oss;
        oss << "Failed to generate NIP-98 token: " << e.what();
        PLOG_ERROR << oss.str();
        throw AuthException(AuthError::TokenGenerationFailed, oss.str());
    }
};

string AuthTokenService::authorizationHeader(
    const string& url,
    const string& httpMethod,
    const optional<ordered_json>& payload)
{
    TokenOptions options;
    options.includeAuthorizationScheme = true;
    options.payload = payload;

    return this->getToken(url, httpMethod, options);
};

#pragma endregion

#pragma region Token Validation

Event AuthTokenService::unpackEventFromToken(const string& token) const
{
    if (token.empty())
    {
        throw AuthException(AuthError::MalformedToken, "Missing token.");
    }

    string encoded = token;
    if (encoded.compare(0, AUTHORIZATION_SCHEME.size(), AUTHORIZATION_SCHEME) == 0)
    {
        encoded = encoded.substr(AUTHORIZATION_SCHEME.size());
    }

    string decoded;
    try
    {
        decoded = Base64::decode(encoded);
    }
    catch (const invalid_argument& e)
    {
        ostringstream oss;
        oss << "Failed to unpack token: " << e.what();
        throw AuthException(AuthError::MalformedToken, oss.str());
    }

    if (decoded.empty() || decoded[0] != '{')
    {
        throw AuthException(AuthError::MalformedToken, "Failed to unpack token: Invalid token format.");
    }

    try
    {
        return Event::fromString(decoded);
    }
    catch (const invalid_argument& e)
    {
        ostringstream oss;
        oss << "Failed to unpack token: Invalid Nostr event structure: " << e.what();
        throw AuthException(AuthError::MalformedToken, oss.str());
    }
};

bool AuthTokenService::validateToken(
    const string& token,
    const string& url,
    const string& method,
    const optional<ordered_json>& body) const
{
    Event event = this->unpackEventFromToken(token);
    this->_validateEvent(event, url, method, body);

    PLOG_DEBUG << "Accepted NIP-98 token for " << _toUpper(method) << " " << url << ".";
    return true;
};

bool AuthTokenService::isTokenAuthorized(
    const string& token,
    const string& url,
    const string& method,
    const optional<ordered_json>& body) const
{
    try
    {
        return this->validateToken(token, url, method, body);
    }
    catch (const AuthException& e)
    {
        PLOG_WARNING << "Rejected NIP-98 token (" << toString(e.code()) << "): " << e.what();
        return false;
    }
};

bool AuthTokenService::validateEventKind(const Event& event) const
{
    return event.kind == HTTP_AUTH_KIND;
};

bool AuthTokenService::validateEventTimestamp(const Event& event) const
{
    if (event.createdAt <= 0)
    {
        return false;
    }

    const long long age = static_cast<long long>(this->_nowSeconds()) - static_cast<long long>(event.createdAt);
    if (age >= this->_config.maxEventAge.count())
    {
        return false;
    }

    // A negative age means the event claims to come from the future.
    return -age <= this->_config.maxClockSkew.count();
};

bool AuthTokenService::validateEventUrlTag(const Event& event, const string& url) const
{
    auto taggedUrl = event.tagValue("u");
    return taggedUrl.has_value() && *taggedUrl == url;
};

bool AuthTokenService::validateEventMethodTag(const Event& event, const string& method) const
{
    auto taggedMethod = event.tagValue("method");
    return taggedMethod.has_value() && _toLower(*taggedMethod) == _toLower(method);
};

bool AuthTokenService::validateEventPayloadTag(const Event& event, const ordered_json& payload) const
{
    auto taggedPayload = event.tagValue("payload");
    if (!taggedPayload.has_value())
    {
        return false;
    }

    try
    {
        return *taggedPayload == this->hashPayload(payload);
    }
    catch (const nlohmann::json::exception& e)
    {
        // Bodies holding invalid UTF-8 cannot be serialized, so they cannot match.
        PLOG_DEBUG << "Unable to hash the request body: " << e.what();
        return false;
    }
};

string AuthTokenService::hashPayload(const ordered_json& payload) const
{
    return PayloadHasher::hash(payload, this->_config.payloadEncoding);
};

#pragma endregion

#pragma region Token Caching

AuthToken AuthTokenService::createTokenObject(const string& token, const Event& event) const
{
    AuthToken tokenObject;
    tokenObject.token = token;
    tokenObject.event = event;
    tokenObject.createdAt = this->_clock();

    return tokenObject;
};

bool AuthTokenService::isTokenValid(const AuthToken& tokenObject) const
{
    auto age = chrono::duration_cast<chrono::milliseconds>(this->_clock() - tokenObject.createdAt);
    return age < this->_config.tokenCacheMaxAge;
};

#pragma endregion

#pragma region Private Helpers

time_t AuthTokenService::_nowSeconds() const
{
    return static_cast<time_t>(
        chrono::duration_cast<chrono::seconds>(this->_clock().time_since_epoch()).count());
};

shared_ptr<Event> AuthTokenService::_buildEventTemplate(
    const string& url,
    const string& httpMethod,
    const optional<ordered_json>& payload) const
{
    auto event = make_shared<Event>();
    event->kind = HTTP_AUTH_KIND;
    event->createdAt = this->_nowSeconds();
    event->content = "";
    event->tags = {
        { "u", url },
        { "method", _toUpper(httpMethod) }
    };

    if (payload.has_value())
    {
        event->tags.push_back({ "payload", this->hashPayload(*payload) });
    }

    return event;
};

void AuthTokenService::_validateEvent(
    const Event& event,
    const string& url,
    const string& method,
    const optional<ordered_json>& body) const
{
    if (!this->validateEventKind(event))
    {
        throw AuthException(AuthError::WrongEventKind, "Invalid event kind for NIP-98.");
    }

    if (!this->validateEventTimestamp(event))
    {
        ostringstream oss;
        oss << "Event timestamp is outside the accepted window (must be within "
            << this->_config.maxEventAge.count() << " seconds).";
        throw AuthException(AuthError::TokenExpired, oss.str());
    }

    if (!this->validateEventUrlTag(event, url))
    {
        throw AuthException(AuthError::UrlMismatch, "Event URL tag does not match request URL.");
    }

    if (!this->validateEventMethodTag(event, method))
    {
        throw AuthException(AuthError::MethodMismatch, "Event method tag does not match request method.");
    }

    bool hasBody = body.has_value() && (body->is_object() || body->is_array()) && !body->empty();
    if (hasBody && !this->validateEventPayloadTag(event, *body))
    {
        throw AuthException(AuthError::PayloadMismatch, "Event payload tag does not match request body hash.");
    }

    if (this->_verifier != nullptr && !this->_verifier->verify(event))
    {
        throw AuthException(AuthError::InvalidSignature, "Event signature is not valid.");
    }
};

#pragma endregion
