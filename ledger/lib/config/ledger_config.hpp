/*
 * Ledger configuration, read from JSON into the LedgerConfig message
 */

#pragma once

#include <string>
#include <vector>

#include "lib/common/ledger_logger.hpp"
#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

struct LedgerSettings
{
    std::vector<PublicKey> admin_authorities;
    PublicKey program_id{};
    std::string profile_seed;
    LogLevel log_level = kLogInfo;
};

// Throws kConfigurationError if the JSON does not describe a valid configuration:
//    - admin_authorities must hold at least one base58 32 byte key
//    - program_id must be a base58 32 byte key
//    - profile_seed defaults to "user_profile"
//    - log_level is one of debug, info, warning, error and defaults to info
LedgerSettings parse_ledger_config(const std::string &json);

LedgerSettings load_ledger_config(const std::string &path);

} // namespace ledger
} // namespace tigerscore
