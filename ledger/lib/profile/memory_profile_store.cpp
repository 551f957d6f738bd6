#include "lib/profile/memory_profile_store.hpp"

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/profile/profile_record.hpp"

namespace tigerscore
{
namespace ledger
{

Optional<Profile> MemoryProfileStore::get(const PublicKey &address) const
{
    std::string bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto iter = records_.find(address);
        if (iter == records_.end())
            return Optional<Profile>();
        bytes = iter->second;
    }
    return Optional<Profile>(parse_profile(bytes));
}

void MemoryProfileStore::put(const PublicKey &address, const Profile &profile)
{
    const std::string bytes = serialize_profile(profile);
    std::lock_guard<std::mutex> lock(mutex_);
    records_[address] = bytes;
}

void MemoryProfileStore::create_if_absent(const PublicKey &address, const Profile &profile)
{
    const std::string bytes = serialize_profile(profile);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!records_.emplace(address, bytes).second)
        THROW_EXCEPTION(kProfileAlreadyExists,
                        "A profile is already stored at " + public_key_to_string(address));
}

bool MemoryProfileStore::has_profile(const PublicKey &address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.find(address) != records_.end();
}

size_t MemoryProfileStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace ledger
} // namespace tigerscore
