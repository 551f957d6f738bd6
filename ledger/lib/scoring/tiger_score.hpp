#pragma once

#include <cstdint>

#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

// Computes the TigerScore of a profile from its current attributes
//
// The score starts at a base of 300 and then adds, in this order:
//    - 60 per successful repayment
//    - 80 if the owner is human verified
//    - 40 if the wallet is at least 6 months old
//    - 40 if the wallet has made at least 100 transactions
//    - 20 if the wallet holds an NFT
//    - 10 per verified credential, at most 30
//    - 110 if the owner's income is verified
//    - the activity regularity score as stored
//
// Every step saturates at 65535, so the result never wraps. There is no cap below
// that ceiling: a profile with enough repayments scores above the 660 override limit.
uint16_t compute_score(const Profile &profile);

// Maps a TigerScore onto a tier from 0-5
//
// Each band is inclusive at its lower edge:
//    >= 900 -> 5
//    >= 700 -> 4
//    >= 500 -> 3
//    >= 200 -> 2
//    >= 50  -> 1
//    otherwise 0
uint8_t tier_of(uint16_t score);

uint16_t saturating_add(uint16_t a, uint32_t b);

} // namespace ledger
} // namespace tigerscore
