/*
 * Common data types
 */

#pragma once

#include <array>
#include <cstdint>

#include "include/tiger_constants.h"

namespace tigerscore
{
namespace ledger
{

typedef std::array<uint8_t, TIGER_PUBKEY_LEN> PublicKey;

// Signals pushed by the admin authority through set_reputation_factors
struct ReputationFactors
{
    ReputationFactors() {}
    ReputationFactors(uint8_t wam, uint32_t tc, bool nft, uint8_t vcc, bool inc, uint8_t ars)
        : wallet_age_months(wam), transaction_count(tc), has_nft(nft),
          verified_credentials_count(vcc), has_income_verification(inc),
          activity_regularity_score(ars)
    {
    }

    uint8_t wallet_age_months = 0;
    uint32_t transaction_count = 0;
    bool has_nft = false;
    uint8_t verified_credentials_count = 0;
    bool has_income_verification = false;
    uint8_t activity_regularity_score = 0;
};

struct Profile
{
    PublicKey owner{};
    PublicKey profile_address{}; ///< Derived storage address, set once at creation

    uint16_t tiger_score = 0;
    uint8_t level_up_tier = 0;

    bool is_human_verified = false;
    uint8_t wallet_age_months = 0;
    uint32_t transaction_count = 0;
    bool has_nft = false;
    uint8_t verified_credentials_count = 0;
    bool has_income_verification = false;
    uint8_t activity_regularity_score = 0;

    // Loan history. Maintained by the lending side, read-only here
    uint32_t total_successful_repayments = 0;
    uint32_t total_defaulted_loans = 0;
    uint64_t on_chain_debt_balance = 0;
    int64_t last_repayment_timestamp = 0; ///< Epoch seconds
};

} // namespace ledger
} // namespace tigerscore
