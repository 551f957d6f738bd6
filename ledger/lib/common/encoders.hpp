#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

// Lowercase hex, used for digests in debug logs
std::string hex_encode(const uint8_t *data, size_t size);
std::string b58_encode(const std::vector<uint8_t> &bytes);

// Base58 rendering used for every key printed or logged by the ledger
std::string public_key_to_string(const PublicKey &key);

} // namespace ledger
} // namespace tigerscore
