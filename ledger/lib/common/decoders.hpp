#pragma once

#include <string>
#include <vector>

#include "include/tiger_constants.h"

#include "lib/common/ledger_exception.hpp"
#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

std::vector<uint8_t> b58_decode(const std::string &b58_string);

// Accepts the raw 32 bytes of a key, e.g. a protobuf bytes field
PublicKey public_key_from_bytes(const std::string &bytes);
// Accepts a base58 encoded key
PublicKey public_key_from_string(const std::string &b58_string);

} // namespace ledger
} // namespace tigerscore
