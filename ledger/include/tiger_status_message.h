#pragma once

#include "include/tiger_status_codes.h"

inline const char *tiger_status_name(TigerStatusCode code)
{
    switch (code)
    {
    case kSuccess:
        return "kSuccess";
    case kUnknownError:
        return "kUnknownError";
    case kInvalidInput:
        return "kInvalidInput";
    case kDecodingError:
        return "kDecodingError";
    case kConfigurationError:
        return "kConfigurationError";
    case kHashError:
        return "kHashError";
    case kUnauthorized:
        return "kUnauthorized";
    case kProfileAlreadyExists:
        return "kProfileAlreadyExists";
    case kProfileNotFound:
        return "kProfileNotFound";
    default:
        return "kUnrecognisedStatus";
    }
}

inline const char *tiger_status_message(TigerStatusCode code)
{
    switch (code)
    {
    case kSuccess:
        return "Success";
    case kUnknownError:
        return "Unknown error";
    case kInvalidInput:
        return "Invalid input";
    case kDecodingError:
        return "Failed to decode input";
    case kConfigurationError:
        return "Invalid ledger configuration";
    case kHashError:
        return "Failed to compute hash";
    case kUnauthorized:
        return "Unauthorized access";
    case kProfileAlreadyExists:
        return "UserProfile already exists";
    case kProfileNotFound:
        return "UserProfile not found";
    default:
        return "Unrecognised status code";
    }
}
