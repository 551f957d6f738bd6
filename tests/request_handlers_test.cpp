#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/profile/memory_profile_store.hpp"
#include "lib/requests/request_handlers.hpp"

#include "test_keys.hpp"

namespace tigerscore
{
namespace ledger
{
namespace
{

using test_support::key_filled_with;

class RequestHandlersTest : public ::testing::Test
{
protected:
    RequestHandlersTest()
        : admin_(public_key_to_string(key_filled_with(0xAA))),
          owner_(public_key_to_string(key_filled_with(0x01))),
          authorities_({key_filled_with(0xAA)}), deriver_("user_profile", key_filled_with(0x07)),
          ledger_(authorities_, deriver_, store_, collector_)
    {
    }

    LedgerResponse create_profile()
    {
        LedgerRequest request;
        request.mutable_create_profile()->set_owner(owner_);
        return handle_request(ledger_, collector_, request);
    }

    std::string admin_;
    std::string owner_;
    AuthoritySet authorities_;
    ProfileAddressDeriver deriver_;
    MemoryProfileStore store_;
    EventCollector collector_;
    ProfileLedger ledger_;
};

TEST_F(RequestHandlersTest, CreateProfile)
{
    const LedgerResponse response = create_profile();
    EXPECT_EQ(response.status(), kSuccess);
    EXPECT_EQ(response.status_name(), "kSuccess");
    EXPECT_EQ(response.profile_address(),
              public_key_to_string(deriver_.derive(key_filled_with(0x01))));
    EXPECT_EQ(response.profile().tiger_score(), 0u);
    ASSERT_EQ(response.events_size(), 1);
    EXPECT_TRUE(response.events(0).has_profile_initialized());

    const LedgerResponse again = create_profile();
    EXPECT_EQ(again.status(), kProfileAlreadyExists);
    EXPECT_EQ(again.status_name(), "kProfileAlreadyExists");
    EXPECT_FALSE(again.has_profile());
    EXPECT_EQ(again.events_size(), 0);
}

TEST_F(RequestHandlersTest, ReputationFactorsExample)
{
    create_profile();

    LedgerRequest request;
    SetReputationFactorsRequest *req = request.mutable_set_reputation_factors();
    req->set_caller(admin_);
    req->set_owner(owner_);
    req->set_wallet_age_months(6);
    req->set_transaction_count(150);
    req->set_has_nft(true);
    req->set_verified_credentials_count(5);
    req->set_has_income_verification(true);
    req->set_activity_regularity_score(100);

    const LedgerResponse response = handle_request(ledger_, collector_, request);
    EXPECT_EQ(response.status(), kSuccess);
    EXPECT_EQ(response.profile().activity_regularity_score(), 40u);
    EXPECT_EQ(response.profile().tiger_score(), 580u);
    EXPECT_EQ(response.profile().level_up_tier(), 3u);
    ASSERT_EQ(response.events_size(), 1);
    EXPECT_EQ(response.events(0).reputation_factors_updated().new_tiger_score(), 580u);
}

TEST_F(RequestHandlersTest, UnauthorizedCaller)
{
    create_profile();

    LedgerRequest request;
    request.mutable_set_human_verified()->set_caller(owner_);
    request.mutable_set_human_verified()->set_owner(owner_);
    request.mutable_set_human_verified()->set_verified(true);

    const LedgerResponse response = handle_request(ledger_, collector_, request);
    EXPECT_EQ(response.status(), kUnauthorized);
    EXPECT_EQ(response.events_size(), 0);
    EXPECT_FALSE(ledger_.get_profile(key_filled_with(0x01)).is_human_verified);
}

TEST_F(RequestHandlersTest, ScoreOverride)
{
    create_profile();

    LedgerRequest request;
    request.mutable_set_score_override()->set_caller(admin_);
    request.mutable_set_score_override()->set_owner(owner_);
    request.mutable_set_score_override()->set_new_score(65535);
    request.mutable_set_score_override()->set_new_tier(2);

    const LedgerResponse response = handle_request(ledger_, collector_, request);
    EXPECT_EQ(response.status(), kSuccess);
    EXPECT_EQ(response.profile().tiger_score(), 660u);
    EXPECT_EQ(response.profile().level_up_tier(), 2u);
}

TEST_F(RequestHandlersTest, OutOfRangeArgumentsAreRejected)
{
    create_profile();

    LedgerRequest request;
    request.mutable_set_score_override()->set_caller(admin_);
    request.mutable_set_score_override()->set_owner(owner_);
    request.mutable_set_score_override()->set_new_score(65536);
    EXPECT_EQ(handle_request(ledger_, collector_, request).status(), kInvalidInput);

    LedgerRequest factors;
    factors.mutable_set_reputation_factors()->set_caller(admin_);
    factors.mutable_set_reputation_factors()->set_owner(owner_);
    factors.mutable_set_reputation_factors()->set_activity_regularity_score(256);
    EXPECT_EQ(handle_request(ledger_, collector_, factors).status(), kInvalidInput);

    EXPECT_EQ(ledger_.get_profile(key_filled_with(0x01)).tiger_score, 0);
}

TEST_F(RequestHandlersTest, MalformedRequests)
{
    LedgerRequest empty;
    EXPECT_EQ(handle_request(ledger_, collector_, empty).status(), kInvalidInput);

    LedgerRequest bad_key;
    bad_key.mutable_get_profile()->set_owner("not-a-key");
    EXPECT_EQ(handle_request(ledger_, collector_, bad_key).status(), kDecodingError);

    LedgerRequest missing_key;
    missing_key.mutable_get_profile();
    EXPECT_EQ(handle_request(ledger_, collector_, missing_key).status(), kInvalidInput);

    EXPECT_EQ(handle_request_bytes(ledger_, collector_, std::string("\xff\xff\xff", 3)).status(),
              kDecodingError);
}

TEST_F(RequestHandlersTest, SerializedRequests)
{
    LedgerRequest request;
    request.mutable_create_profile()->set_owner(owner_);
    std::string bytes;
    ASSERT_TRUE(request.SerializeToString(&bytes));
    EXPECT_EQ(handle_request_bytes(ledger_, collector_, bytes).status(), kSuccess);

    LedgerRequest lookup;
    lookup.mutable_get_profile()->set_owner(owner_);
    ASSERT_TRUE(lookup.SerializeToString(&bytes));
    const LedgerResponse response = handle_request_bytes(ledger_, collector_, bytes);
    EXPECT_EQ(response.status(), kSuccess);
    EXPECT_EQ(response.events_size(), 0);
}

TEST_F(RequestHandlersTest, UnknownProfile)
{
    LedgerRequest request;
    request.mutable_get_profile()->set_owner(owner_);
    const LedgerResponse response = handle_request(ledger_, collector_, request);
    EXPECT_EQ(response.status(), kProfileNotFound);
    EXPECT_FALSE(response.message().empty());
}

TEST_F(RequestHandlersTest, ConcurrentRequestsKeepTheirOwnEvents)
{
    const int thread_count = 8;
    const int requests_per_thread = 50;
    std::vector<std::vector<LedgerResponse>> responses(thread_count);
    std::vector<std::vector<std::string>> owners(thread_count);

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; t++)
    {
        threads.emplace_back([this, t, &responses, &owners]() {
            for (int i = 0; i < requests_per_thread; i++)
            {
                PublicKey owner = key_filled_with(0x40);
                owner[0] = static_cast<uint8_t>(t);
                owner[1] = static_cast<uint8_t>(i);
                owners[t].push_back(public_key_to_string(owner));

                LedgerRequest request;
                request.mutable_create_profile()->set_owner(owners[t].back());
                responses[t].push_back(handle_request(ledger_, collector_, request));
            }
        });
    }
    for (std::thread &thread : threads)
        thread.join();

    for (int t = 0; t < thread_count; t++)
    {
        ASSERT_EQ(responses[t].size(), static_cast<size_t>(requests_per_thread));
        for (int i = 0; i < requests_per_thread; i++)
        {
            const LedgerResponse &response = responses[t][i];
            EXPECT_EQ(response.status(), kSuccess);
            ASSERT_EQ(response.events_size(), 1);
            ASSERT_TRUE(response.events(0).has_profile_initialized());
            EXPECT_EQ(response.events(0).profile_initialized().owner(), owners[t][i]);
        }
    }
    EXPECT_EQ(store_.size(), static_cast<size_t>(thread_count * requests_per_thread));
}

TEST(CaptureExceptionsTest, MapsExceptionsToCodes)
{
    std::string message;
    EXPECT_EQ(capture_exceptions([]() {}, &message), kSuccess);
    EXPECT_EQ(capture_exceptions(
                  []() { throw LedgerException(kUnauthorized, __FILE__, __func__, __LINE__); },
                  &message),
              kUnauthorized);
    EXPECT_NE(message.find("Unauthorized access"), std::string::npos);
    EXPECT_EQ(capture_exceptions([]() { throw std::runtime_error("boom"); }, &message),
              kUnknownError);
    EXPECT_EQ(message, "boom");
}

} // namespace
} // namespace ledger
} // namespace tigerscore
