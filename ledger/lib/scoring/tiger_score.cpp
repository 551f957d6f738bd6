#include "lib/scoring/tiger_score.hpp"

#include <algorithm>
#include <limits>

#include "include/tiger_constants.h"

namespace tigerscore
{
namespace ledger
{

namespace
{

const uint16_t max_score = std::numeric_limits<uint16_t>::max();

struct TierThreshold
{
    uint16_t min_score;
    uint8_t tier;
};

// Highest band first, the first match wins
const TierThreshold tier_thresholds[] = {{900, 5}, {700, 4}, {500, 3}, {200, 2}, {50, 1}};

} // namespace

uint16_t saturating_add(uint16_t a, uint32_t b)
{
    if (b >= static_cast<uint32_t>(max_score - a))
        return max_score;
    return static_cast<uint16_t>(a + b);
}

uint16_t compute_score(const Profile &profile)
{
    uint16_t score = 0;

    score = saturating_add(score, TIGER_BASE_SCORE);

    // Widen before multiplying so the product itself cannot wrap
    const uint64_t repayment_points =
        static_cast<uint64_t>(profile.total_successful_repayments) * TIGER_REPAYMENT_POINTS;
    score = saturating_add(
        score, static_cast<uint32_t>(std::min<uint64_t>(repayment_points, max_score)));

    if (profile.is_human_verified)
        score = saturating_add(score, TIGER_HUMAN_VERIFIED_POINTS);

    if (profile.wallet_age_months >= TIGER_WALLET_AGE_MIN_MONTHS)
        score = saturating_add(score, TIGER_WALLET_AGE_POINTS);

    if (profile.transaction_count >= TIGER_TRANSACTION_MIN_COUNT)
        score = saturating_add(score, TIGER_TRANSACTION_POINTS);

    if (profile.has_nft)
        score = saturating_add(score, TIGER_NFT_POINTS);

    const uint32_t credential_points =
        std::min<uint32_t>(static_cast<uint32_t>(profile.verified_credentials_count) *
                               TIGER_CREDENTIAL_POINTS,
                           TIGER_CREDENTIAL_MAX_POINTS);
    score = saturating_add(score, credential_points);

    if (profile.has_income_verification)
        score = saturating_add(score, TIGER_INCOME_VERIFIED_POINTS);

    score = saturating_add(score, profile.activity_regularity_score);

    return score;
}

uint8_t tier_of(uint16_t score)
{
    for (const TierThreshold &threshold : tier_thresholds)
    {
        if (score >= threshold.min_score)
            return threshold.tier;
    }
    return 0;
}

} // namespace ledger
} // namespace tigerscore
