#include <gtest/gtest.h>

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/crypto/hash.hpp"
#include "lib/profile/profile_address.hpp"

#include "test_keys.hpp"

namespace tigerscore
{
namespace ledger
{
namespace
{

using test_support::key_filled_with;
using test_support::sequential_key;

TEST(HashTest, Sha256KnownValue)
{
    const std::string abc = "abc";
    const auto digest = Hash::get_SHA_256_digest(std::vector<uint8_t>(abc.begin(), abc.end()));
    EXPECT_EQ(hex_encode(digest.data(), digest.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ProfileAddressTest, KnownDerivation)
{
    const PublicKey address =
        derive_profile_address("user_profile", sequential_key(), key_filled_with(7));
    EXPECT_EQ(hex_encode(address.data(), address.size()),
              "4de4165d56d4fd01d5ac2f6b54a874f162b25ec871de61010b8e462b1232c1cf");
    EXPECT_EQ(public_key_to_string(address), "6F47dfPsq7te1QFGfbg3H4DoqLK71wibMoGmP7YpqTkS");
}

TEST(ProfileAddressTest, DependsOnEveryInput)
{
    const PublicKey base =
        derive_profile_address("user_profile", key_filled_with(1), key_filled_with(7));
    EXPECT_EQ(base, derive_profile_address("user_profile", key_filled_with(1), key_filled_with(7)));
    EXPECT_NE(base, derive_profile_address("user_profile", key_filled_with(2), key_filled_with(7)));
    EXPECT_NE(base, derive_profile_address("user_profile", key_filled_with(1), key_filled_with(8)));
    EXPECT_NE(base, derive_profile_address("loan_account", key_filled_with(1), key_filled_with(7)));
}

TEST(ProfileAddressTest, DeriverUsesItsSeedAndProgram)
{
    const ProfileAddressDeriver deriver("user_profile", key_filled_with(7));
    EXPECT_EQ(deriver.seed(), "user_profile");
    EXPECT_EQ(deriver.program_id(), key_filled_with(7));
    EXPECT_EQ(deriver.derive(sequential_key()),
              derive_profile_address("user_profile", sequential_key(), key_filled_with(7)));

    EXPECT_THROW(ProfileAddressDeriver("", key_filled_with(7)), LedgerException);
}

} // namespace
} // namespace ledger
} // namespace tigerscore
