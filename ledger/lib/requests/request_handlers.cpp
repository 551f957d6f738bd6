#include "lib/requests/request_handlers.hpp"

#include <limits>
#include <mutex>

#include "include/tiger_constants.h"
#include "include/tiger_status_message.h"

#include "lib/common/decoders.hpp"
#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"
#include "lib/common/ledger_logger.hpp"
#include "lib/profile/profile_record.hpp"

namespace tigerscore
{
namespace ledger
{

namespace
{

template <typename T> T request_field(uint32_t value, const char *field_name)
{
    if (value > static_cast<uint32_t>(std::numeric_limits<T>::max()))
        THROW_EXCEPTION(kInvalidInput,
                        std::string("Request field ") + field_name + " out of range (" +
                            std::to_string(value) + ")");
    return static_cast<T>(value);
}

PublicKey request_key(const std::string &value, const char *field_name)
{
    if (value.empty())
        THROW_EXCEPTION(kInvalidInput, std::string("Request field ") + field_name + " is missing");
    return public_key_from_string(value);
}

void set_profile(LedgerResponse &response, const Profile &profile)
{
    response.set_profile_address(public_key_to_string(profile.profile_address));
    *response.mutable_profile() = profile_to_record(profile);
}

void process_request(ProfileLedger &ledger, const LedgerRequest &request, LedgerResponse &response)
{
    switch (request.request_case())
    {
    case LedgerRequest::kCreateProfile:
    {
        const CreateProfileRequest &req = request.create_profile();
        const PublicKey owner = request_key(req.owner(), "owner");
        ledger.create_profile(owner);
        set_profile(response, ledger.get_profile(owner));
        break;
    }
    case LedgerRequest::kSetHumanVerified:
    {
        const SetHumanVerifiedRequest &req = request.set_human_verified();
        const Profile profile = ledger.set_human_verified(
            request_key(req.caller(), "caller"), request_key(req.owner(), "owner"), req.verified());
        set_profile(response, profile);
        break;
    }
    case LedgerRequest::kSetReputationFactors:
    {
        const SetReputationFactorsRequest &req = request.set_reputation_factors();
        const ReputationFactors factors(
            request_field<uint8_t>(req.wallet_age_months(), "wallet_age_months"),
            req.transaction_count(),
            req.has_nft(),
            request_field<uint8_t>(req.verified_credentials_count(), "verified_credentials_count"),
            req.has_income_verification(),
            request_field<uint8_t>(req.activity_regularity_score(), "activity_regularity_score"));
        const Profile profile = ledger.set_reputation_factors(
            request_key(req.caller(), "caller"), request_key(req.owner(), "owner"), factors);
        set_profile(response, profile);
        break;
    }
    case LedgerRequest::kSetScoreOverride:
    {
        const SetScoreOverrideRequest &req = request.set_score_override();
        const Profile profile =
            ledger.set_score_override(request_key(req.caller(), "caller"),
                                      request_key(req.owner(), "owner"),
                                      request_field<uint16_t>(req.new_score(), "new_score"),
                                      request_field<uint8_t>(req.new_tier(), "new_tier"));
        set_profile(response, profile);
        break;
    }
    case LedgerRequest::kGetProfile:
    {
        const GetProfileRequest &req = request.get_profile();
        set_profile(response, ledger.get_profile(request_key(req.owner(), "owner")));
        break;
    }
    default:
        THROW_EXCEPTION(kInvalidInput, "Request does not name an operation");
    }
}

} // namespace

TigerStatusCode capture_exceptions(const std::function<void()> &logic, std::string *message)
{
    try
    {
        logic();
    }
    catch (const LedgerException &e)
    {
        EXCEPTION_LOG(e);
        if (message != nullptr)
            *message = e.what();
        return e.get_code();
    }
    catch (const std::exception &e)
    {
        ERROR_LOG("%s", e.what());
        if (message != nullptr)
            *message = e.what();
        return kUnknownError;
    }

    return kSuccess;
}

LedgerResponse
handle_request(ProfileLedger &ledger, EventCollector &collector, const LedgerRequest &request)
{
    LedgerResponse response;
    // Other requests through the same collector wait, so the events below are this one's
    std::unique_lock<std::mutex> request_lock = collector.lock_requests();
    collector.take_events();

    std::string message;
    const TigerStatusCode status =
        capture_exceptions([&]() { process_request(ledger, request, response); }, &message);

    if (status != kSuccess)
    {
        // Drop any partial output, a rejected request reports only its status
        response.Clear();
        response.set_message(message);
    }
    response.set_status(static_cast<int32_t>(status));
    response.set_status_name(tiger_status_name(status));

    for (const LedgerEvent &event : collector.take_events())
        *response.add_events() = event;

    return response;
}

LedgerResponse
handle_request_bytes(ProfileLedger &ledger, EventCollector &collector, const std::string &bytes)
{
    LedgerRequest request;
    if (bytes.size() > TIGER_MAX_REQUEST_LEN || !request.ParseFromString(bytes))
    {
        ERROR_LOG("Cannot parse protobuf message of %zu bytes", bytes.size());
        LedgerResponse response;
        response.set_status(static_cast<int32_t>(kDecodingError));
        response.set_status_name(tiger_status_name(kDecodingError));
        response.set_message("Cannot parse protobuf message");
        return response;
    }
    return handle_request(ledger, collector, request);
}

} // namespace ledger
} // namespace tigerscore
