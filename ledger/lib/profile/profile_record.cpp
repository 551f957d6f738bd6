#include "lib/profile/profile_record.hpp"

#include <algorithm>
#include <limits>

#include "include/tiger_constants.h"

#include "lib/common/ledger_exception.hpp"

namespace tigerscore
{
namespace ledger
{

namespace
{

template <typename T> T narrow_field(uint32_t value, const char *field_name)
{
    if (value > static_cast<uint32_t>(std::numeric_limits<T>::max()))
        THROW_EXCEPTION(kDecodingError,
                        std::string("Profile record field ") + field_name + " out of range (" +
                            std::to_string(value) + ")");
    return static_cast<T>(value);
}

PublicKey key_field(const std::string &bytes, const char *field_name)
{
    if (bytes.size() != TIGER_PUBKEY_LEN)
        THROW_EXCEPTION(kDecodingError,
                        std::string("Profile record field ") + field_name + " has wrong size");
    PublicKey key;
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

} // namespace

ProfileRecord profile_to_record(const Profile &profile)
{
    ProfileRecord record;
    record.set_owner(std::string(profile.owner.begin(), profile.owner.end()));
    record.set_profile_address(
        std::string(profile.profile_address.begin(), profile.profile_address.end()));
    record.set_tiger_score(profile.tiger_score);
    record.set_level_up_tier(profile.level_up_tier);
    record.set_is_human_verified(profile.is_human_verified);
    record.set_wallet_age_months(profile.wallet_age_months);
    record.set_transaction_count(profile.transaction_count);
    record.set_has_nft(profile.has_nft);
    record.set_verified_credentials_count(profile.verified_credentials_count);
    record.set_has_income_verification(profile.has_income_verification);
    record.set_activity_regularity_score(profile.activity_regularity_score);
    record.set_total_successful_repayments(profile.total_successful_repayments);
    record.set_total_defaulted_loans(profile.total_defaulted_loans);
    record.set_on_chain_debt_balance(profile.on_chain_debt_balance);
    record.set_last_repayment_timestamp(profile.last_repayment_timestamp);
    return record;
}

Profile profile_from_record(const ProfileRecord &record)
{
    Profile profile;
    profile.owner = key_field(record.owner(), "owner");
    profile.profile_address = key_field(record.profile_address(), "profile_address");
    profile.tiger_score = narrow_field<uint16_t>(record.tiger_score(), "tiger_score");
    profile.level_up_tier = narrow_field<uint8_t>(record.level_up_tier(), "level_up_tier");
    profile.is_human_verified = record.is_human_verified();
    profile.wallet_age_months =
        narrow_field<uint8_t>(record.wallet_age_months(), "wallet_age_months");
    profile.transaction_count = record.transaction_count();
    profile.has_nft = record.has_nft();
    profile.verified_credentials_count =
        narrow_field<uint8_t>(record.verified_credentials_count(), "verified_credentials_count");
    profile.has_income_verification = record.has_income_verification();
    profile.activity_regularity_score =
        narrow_field<uint8_t>(record.activity_regularity_score(), "activity_regularity_score");
    profile.total_successful_repayments = record.total_successful_repayments();
    profile.total_defaulted_loans = record.total_defaulted_loans();
    profile.on_chain_debt_balance = record.on_chain_debt_balance();
    profile.last_repayment_timestamp = record.last_repayment_timestamp();
    return profile;
}

std::string serialize_profile(const Profile &profile)
{
    std::string bytes;
    if (!profile_to_record(profile).SerializeToString(&bytes))
        THROW_EXCEPTION(kUnknownError, "Cannot serialize profile record");
    return bytes;
}

Profile parse_profile(const std::string &bytes)
{
    ProfileRecord record;
    if (!record.ParseFromString(bytes))
        THROW_EXCEPTION(kDecodingError, "Cannot parse profile record");
    return profile_from_record(record);
}

} // namespace ledger
} // namespace tigerscore
