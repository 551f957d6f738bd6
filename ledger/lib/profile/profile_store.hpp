#pragma once

#include "lib/common/optional.hpp"
#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

// Keyed storage of profile records, addressed by derived profile address
class ProfileStore
{
public:
    virtual ~ProfileStore() {}

    virtual Optional<Profile> get(const PublicKey &address) const = 0;
    virtual void put(const PublicKey &address, const Profile &profile) = 0;
    // Throws kProfileAlreadyExists if a record is already stored at the address
    virtual void create_if_absent(const PublicKey &address, const Profile &profile) = 0;
};

} // namespace ledger
} // namespace tigerscore
