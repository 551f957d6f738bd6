/*
 * Conversion between profiles and their stored protobuf records
 */

#pragma once

#include <string>

#include "lib/common/types.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#pragma GCC diagnostic pop

namespace tigerscore
{
namespace ledger
{

ProfileRecord profile_to_record(const Profile &profile);

// Throws kDecodingError if a key has the wrong size or a field is out of range
Profile profile_from_record(const ProfileRecord &record);

std::string serialize_profile(const Profile &profile);
Profile parse_profile(const std::string &bytes);

} // namespace ledger
} // namespace tigerscore
