#pragma once

#include <string>

#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

// Get the storage address of an owner's profile
//
// address = SHA-256(seed || owner || program_id || "ProgramDerivedAddress")
//
// The seed namespaces the address space so the same owner can hold records of other
// kinds under the same program.
PublicKey derive_profile_address(const std::string &seed,
                                 const PublicKey &owner,
                                 const PublicKey &program_id);

class ProfileAddressDeriver
{
public:
    ProfileAddressDeriver(const std::string &seed, const PublicKey &program_id);

    PublicKey derive(const PublicKey &owner) const
    {
        return derive_profile_address(seed_, owner, program_id_);
    }

    const std::string &seed() const { return seed_; }
    const PublicKey &program_id() const { return program_id_; }

private:
    std::string seed_;
    PublicKey program_id_;
};

} // namespace ledger
} // namespace tigerscore
