#pragma once

enum TigerStatusCode
{
    kSuccess = 0,
    kUnknownError = 1,
    kInvalidInput = 2,
    kDecodingError = 3,
    kConfigurationError = 4,
    kHashError = 5,

    // Ledger
    kUnauthorized = 100,
    kProfileAlreadyExists = 101,
    kProfileNotFound = 102
};
