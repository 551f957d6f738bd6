#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "include/tiger_constants.h"

namespace tigerscore
{
namespace ledger
{

class Hash
{
public:
    static std::array<uint8_t, TIGER_SHA_256_LEN>
    get_SHA_256_digest(const std::vector<uint8_t> &message);
};

} // namespace ledger
} // namespace tigerscore
