#include "noscrypt_logger.hpp"

void hydrator::internal::printNoscryptError(NCResult result, const char* func, int line)
{
    if (result == NC_SUCCESS)
    {
        return;
    }

    uint8_t argPosition = 0;
    NCResult code = NCParseErrorCode(result, &argPosition);

    // Widen so the stream prints a number rather than a character.
    int position = argPosition;

    switch (code)
    {
    case E_NULL_PTR:
        PLOG_ERROR << "noscrypt - error: A null pointer was passed in " << func << "(" << position << ") at line " << line;
        break;

    case E_INVALID_ARG:
        PLOG_ERROR << "noscrypt - error: An invalid argument was passed in " << func << "(" << position << ") at line " << line;
        break;

    case E_INVALID_CONTEXT:
        PLOG_ERROR << "noscrypt - error: An invalid context was passed in " << func << "(" << position << ") at line " << line;
        break;

    case E_ARGUMENT_OUT_OF_RANGE:
        PLOG_ERROR << "noscrypt - error: An argument was out of range in " << func << "(" << position << ") at line " << line;
        break;

    case E_OPERATION_FAILED:
        PLOG_ERROR << "noscrypt - error: An operation failed in " << func << "(" << position << ") at line " << line;
        break;

    default:
        PLOG_ERROR << "noscrypt - error: An unknown error " << result << " occurred in " << func << "(" << position << ") at line " << line;
        break;
    }
};
