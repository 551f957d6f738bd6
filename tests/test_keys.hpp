#pragma once

#include <algorithm>
#include <cstdint>

#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{
namespace test_support
{

inline PublicKey key_filled_with(uint8_t value)
{
    PublicKey key;
    key.fill(value);
    return key;
}

// 0x00, 0x01, ..., 0x1f
inline PublicKey sequential_key()
{
    PublicKey key;
    for (size_t i = 0; i < key.size(); i++)
        key[i] = static_cast<uint8_t>(i);
    return key;
}

} // namespace test_support
} // namespace ledger
} // namespace tigerscore
