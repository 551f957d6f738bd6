#pragma once

#include <cstddef>
#include <set>
#include <vector>

#include "lib/common/types.hpp"

namespace tigerscore
{
namespace ledger
{

// Identities allowed to push signals into profiles
class AuthoritySet
{
private:
    std::set<PublicKey> authorities_;

public:
    explicit AuthoritySet(const std::vector<PublicKey> &authorities);

    bool is_authorized(const PublicKey &caller) const;
    // Throws kUnauthorized if the caller is not an authority
    void require_authorized(const PublicKey &caller) const;

    size_t size() const { return authorities_.size(); }
};

} // namespace ledger
} // namespace tigerscore
