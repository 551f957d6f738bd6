#include "lib/profile/profile_address.hpp"

#include <vector>

#include "include/tiger_constants.h"

#include "lib/common/ledger_exception.hpp"
#include "lib/common/ledger_logger.hpp"
#include "lib/crypto/hash.hpp"

namespace tigerscore
{
namespace ledger
{

PublicKey derive_profile_address(const std::string &seed,
                                 const PublicKey &owner,
                                 const PublicKey &program_id)
{
    const std::string marker = TIGER_ADDRESS_MARKER;

    std::vector<uint8_t> message;
    message.reserve(seed.size() + owner.size() + program_id.size() + marker.size());
    message.insert(message.end(), seed.begin(), seed.end());
    message.insert(message.end(), owner.begin(), owner.end());
    message.insert(message.end(), program_id.begin(), program_id.end());
    message.insert(message.end(), marker.begin(), marker.end());

    const PublicKey address = Hash::get_SHA_256_digest(message);
    DEBUG_HEX_LOG("Derived profile address", address.data(), address.size());

    return address;
}

ProfileAddressDeriver::ProfileAddressDeriver(const std::string &seed, const PublicKey &program_id)
    : seed_(seed), program_id_(program_id)
{
    if (seed_.empty())
        THROW_EXCEPTION(kInvalidInput, "Profile seed must not be empty");
}

} // namespace ledger
} // namespace tigerscore
