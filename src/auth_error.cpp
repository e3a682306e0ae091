#include "auth_error.hpp"

using namespace std;

namespace nip98
{
string toString(AuthError error)
{
    switch (error)
    {
    case AuthError::NoSignerAvailable:
        return "NoSignerAvailable";
    case AuthError::NotConnected:
        return "NotConnected";
    case AuthError::SignerRejected:
        return "SignerRejected";
    case AuthError::SigningFailed:
        return "SigningFailed";
    case AuthError::TokenGenerationFailed:
        return "TokenGenerationFailed";
    case AuthError::MalformedToken:
        return "MalformedToken";
    case AuthError::WrongEventKind:
        return "WrongEventKind";
    case AuthError::TokenExpired:
        return "TokenExpired";
    case AuthError::UrlMismatch:
        return "UrlMismatch";
    case AuthError::MethodMismatch:
        return "MethodMismatch";
    case AuthError::PayloadMismatch:
        return "PayloadMismatch";
    case AuthError::InvalidSignature:
        return "InvalidSignature";
    }

    return "Unknown";
};

AuthException::AuthException(AuthError code, const string& message)
: runtime_error(message), _code(code) { };

AuthError AuthException::code() const noexcept { return this->_code; };
} // namespace nip98
