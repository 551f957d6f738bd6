#include "lib/crypto/hash.hpp"

#include "mbedtls/md.h"

#include "lib/common/ledger_exception.hpp"

namespace tigerscore
{
namespace ledger
{

std::array<uint8_t, TIGER_SHA_256_LEN> Hash::get_SHA_256_digest(const std::vector<uint8_t> &message)
{
    std::array<uint8_t, TIGER_SHA_256_LEN> output;

    const mbedtls_md_info_t *mdinfo = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (mdinfo == nullptr)
        THROW_EXCEPTION(kHashError, "SHA-256 is not available in mbedtls");

    const int ret = mbedtls_md(mdinfo, message.data(), message.size(), output.data());
    if (ret != 0)
        THROW_EXCEPTION(kHashError, "Failed to create SHA-256 hash (" + std::to_string(ret) + ")");

    return output;
}

} // namespace ledger
} // namespace tigerscore
