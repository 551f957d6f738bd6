#include "lib/profile/profile_ledger.hpp"

#include <algorithm>

#include "include/tiger_constants.h"

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/common/ledger_logger.hpp"
#include "lib/scoring/tiger_score.hpp"

namespace tigerscore
{
namespace ledger
{

ProfileLedger::ProfileLedger(const AuthoritySet &authorities,
                             const ProfileAddressDeriver &deriver,
                             ProfileStore &store,
                             ProfileEventSink &events)
    : authorities_(authorities), deriver_(deriver), store_(store), events_(events)
{
}

Profile ProfileLedger::load_profile(const PublicKey &address) const
{
    const Optional<Profile> profile = store_.get(address);
    if (!profile.has_value())
        THROW_EXCEPTION(kProfileNotFound, "No profile stored at " + public_key_to_string(address));
    return profile.value();
}

void ProfileLedger::recompute(Profile &profile)
{
    profile.tiger_score = compute_score(profile);
    profile.level_up_tier = tier_of(profile.tiger_score);
}

PublicKey ProfileLedger::create_profile(const PublicKey &owner)
{
    const PublicKey address = deriver_.derive(owner);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Profile profile;
        profile.owner = owner;
        profile.profile_address = address;
        store_.create_if_absent(address, profile);
    }

    const std::string address_str = public_key_to_string(address);
    DEBUG_LOG("Created profile %s", address_str.c_str());

    ProfileInitialized event;
    event.set_owner(public_key_to_string(owner));
    event.set_profile_address(address_str);
    event.set_did_address(address_str);
    events_.on_profile_initialized(event);

    return address;
}

Profile
ProfileLedger::set_human_verified(const PublicKey &caller, const PublicKey &owner, bool verified)
{
    authorities_.require_authorized(caller);

    const PublicKey address = deriver_.derive(owner);
    Profile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        profile = load_profile(address);
        profile.is_human_verified = verified;
        recompute(profile);
        store_.put(address, profile);
    }

    HumanVerificationUpdated event;
    event.set_profile_address(public_key_to_string(address));
    event.set_is_verified(verified);
    event.set_new_tiger_score(profile.tiger_score);
    events_.on_human_verification_updated(event);

    return profile;
}

Profile ProfileLedger::set_reputation_factors(const PublicKey &caller,
                                             const PublicKey &owner,
                                             const ReputationFactors &factors)
{
    authorities_.require_authorized(caller);

    const PublicKey address = deriver_.derive(owner);
    Profile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        profile = load_profile(address);
        profile.wallet_age_months = factors.wallet_age_months;
        profile.transaction_count = factors.transaction_count;
        profile.has_nft = factors.has_nft;
        profile.verified_credentials_count = factors.verified_credentials_count;
        profile.has_income_verification = factors.has_income_verification;
        profile.activity_regularity_score = std::min<uint8_t>(
            factors.activity_regularity_score, TIGER_MAX_ACTIVITY_REGULARITY);
        recompute(profile);
        store_.put(address, profile);
    }

    ReputationFactorsUpdated event;
    event.set_profile_address(public_key_to_string(address));
    event.set_new_tiger_score(profile.tiger_score);
    event.set_new_level_up_tier(profile.level_up_tier);
    events_.on_reputation_factors_updated(event);

    return profile;
}

Profile ProfileLedger::set_score_override(const PublicKey &caller,
                                         const PublicKey &owner,
                                         uint16_t new_score,
                                         uint8_t new_tier)
{
    authorities_.require_authorized(caller);

    const PublicKey address = deriver_.derive(owner);
    Profile profile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        profile = load_profile(address);
        profile.tiger_score = std::min<uint16_t>(new_score, TIGER_MAX_OVERRIDE_SCORE);
        profile.level_up_tier = new_tier;
        store_.put(address, profile);
    }

    if (new_tier > TIGER_MAX_TIER)
        WARNING_LOG("Override stored tier %u outside 0-%d",
                    static_cast<unsigned>(new_tier),
                    TIGER_MAX_TIER);

    TigerScoreOverridden event;
    event.set_profile_address(public_key_to_string(address));
    event.set_requested_score(new_score);
    event.set_new_score(profile.tiger_score);
    event.set_new_tier(new_tier);
    events_.on_tiger_score_overridden(event);

    return profile;
}

Profile ProfileLedger::get_profile(const PublicKey &owner) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return load_profile(deriver_.derive(owner));
}

} // namespace ledger
} // namespace tigerscore
