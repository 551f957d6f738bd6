#include "lib/profile/authority_set.hpp"

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/common/ledger_logger.hpp"

namespace tigerscore
{
namespace ledger
{

AuthoritySet::AuthoritySet(const std::vector<PublicKey> &authorities)
    : authorities_(authorities.begin(), authorities.end())
{
    if (authorities_.empty())
        THROW_EXCEPTION(kConfigurationError, "At least one admin authority is required");
}

bool AuthoritySet::is_authorized(const PublicKey &caller) const
{
    return authorities_.find(caller) != authorities_.end();
}

void AuthoritySet::require_authorized(const PublicKey &caller) const
{
    if (is_authorized(caller))
        return;

    WARNING_LOG("Rejected caller %s", public_key_to_string(caller).c_str());
    THROW_ERROR_CODE(kUnauthorized);
}

} // namespace ledger
} // namespace tigerscore
