#pragma once

#include <stdexcept>
#include <string>

namespace nip98
{
/**
 * @brief Reasons an authentication operation can fail.
 */
enum class AuthError
{
    // Token generation.
    NoSignerAvailable,
    NotConnected,
    SignerRejected,
    SigningFailed,
    TokenGenerationFailed,

    // Token validation.
    MalformedToken,
    WrongEventKind,
    TokenExpired,
    UrlMismatch,
    MethodMismatch,
    PayloadMismatch,
    InvalidSignature
};

/**
 * @brief Gets the name of an error code, e.g. `"TokenExpired"`.
 */
std::string toString(AuthError error);

/**
 * @brief Thrown when token generation or validation fails.
 * @remark None of these failures are retried internally.  Callers that only need a yes/no
 * answer should use `AuthTokenService::isTokenAuthorized`.
 */
class AuthException : public std::runtime_error
{
public:
    AuthException(AuthError code, const std::string& message);

    AuthError code() const noexcept;

private:
    AuthError _code;
};
} // namespace nip98
