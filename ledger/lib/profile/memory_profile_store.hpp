#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include "lib/profile/profile_store.hpp"

namespace tigerscore
{
namespace ledger
{

// Holds every profile as its serialized record, the way account data is held by a chain
class MemoryProfileStore : public ProfileStore
{
private:
    std::map<PublicKey, std::string> records_;
    mutable std::mutex mutex_;

public:
    MemoryProfileStore() {}

    Optional<Profile> get(const PublicKey &address) const override;
    void put(const PublicKey &address, const Profile &profile) override;
    void create_if_absent(const PublicKey &address, const Profile &profile) override;

    bool has_profile(const PublicKey &address) const;
    size_t size() const;
};

} // namespace ledger
} // namespace tigerscore
