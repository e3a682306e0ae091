#include <sstream>

#include "noscrypt_logger.hpp"

using namespace std;

namespace nip98
{
namespace internal
{
static const char* _reasonFor(int errorCode)
{
    switch (errorCode)
    {
    case E_NULL_PTR:
        return "null pointer argument";

    case E_INVALID_ARG:
        return "invalid argument";

    case E_INVALID_CONTEXT:
        return "invalid context";

    case E_ARGUMENT_OUT_OF_RANGE:
        return "argument out of range";

    case E_OPERATION_FAILED:
        return "operation failed";

    default:
        return nullptr;
    }
};

string describeNoscryptError(NCResult result, const char* func, int line)
{
    uint8_t argPosition = 0;
    int errorCode = NCParseErrorCode(result, &argPosition);

    ostringstream oss;
    oss << "noscrypt ";

    const char* reason = _reasonFor(errorCode);
    if (reason != nullptr)
    {
        oss << reason << " (argument " << static_cast<int>(argPosition) << ")";
    }
    else
    {
        oss << "error " << result;
    }

    oss << " in " << func << " at line " << line;
    return oss.str();
};

string logNoscryptError(NCResult result, const char* func, int line)
{
    string message = describeNoscryptError(result, func, line);
    PLOG_ERROR << message;
    return message;
};
} // namespace internal
} // namespace nip98
