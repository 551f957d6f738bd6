/*
 * State transitions of user profiles
 */

#pragma once

#include <mutex>

#include "lib/common/types.hpp"
#include "lib/profile/authority_set.hpp"
#include "lib/profile/profile_address.hpp"
#include "lib/profile/profile_events.hpp"
#include "lib/profile/profile_store.hpp"

namespace tigerscore
{
namespace ledger
{

// Applies the profile operations against a store
//
// Each operation is one read-modify-write under the ledger's lock. Events are emitted
// after the lock is released, so a sink may call back into the ledger. Rejections are
// thrown as LedgerException before anything is stored or emitted. The store, sink and
// deriver are borrowed and must outlive the ledger.
class ProfileLedger
{
public:
    ProfileLedger(const AuthoritySet &authorities,
                  const ProfileAddressDeriver &deriver,
                  ProfileStore &store,
                  ProfileEventSink &events);

    // Creates a zeroed profile owned by the signing owner and returns its address.
    // Throws kProfileAlreadyExists if the owner already has one.
    PublicKey create_profile(const PublicKey &owner);

    Profile set_human_verified(const PublicKey &caller, const PublicKey &owner, bool verified);

    // activity_regularity_score is clamped to 40 before it is stored
    Profile set_reputation_factors(const PublicKey &caller,
                                   const PublicKey &owner,
                                   const ReputationFactors &factors);

    // Stores min(new_score, 660) and the caller's tier as given. The tier is not
    // recomputed from the score.
    Profile set_score_override(const PublicKey &caller,
                               const PublicKey &owner,
                               uint16_t new_score,
                               uint8_t new_tier);

    // Throws kProfileNotFound if the owner has no profile
    Profile get_profile(const PublicKey &owner) const;

    PublicKey profile_address(const PublicKey &owner) const { return deriver_.derive(owner); }

private:
    Profile load_profile(const PublicKey &address) const;
    static void recompute(Profile &profile);

    const AuthoritySet &authorities_;
    const ProfileAddressDeriver &deriver_;
    ProfileStore &store_;
    ProfileEventSink &events_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace tigerscore
