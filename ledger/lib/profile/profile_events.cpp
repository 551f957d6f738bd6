#include "lib/profile/profile_events.hpp"

#include <utility>

#include "lib/common/ledger_logger.hpp"

namespace tigerscore
{
namespace ledger
{

void LoggingEventSink::on_profile_initialized(const ProfileInitialized &event)
{
    INFO_LOG("UserProfileInitialized owner=%s profile=%s did=%s",
             event.owner().c_str(),
             event.profile_address().c_str(),
             event.did_address().c_str());
}

void LoggingEventSink::on_human_verification_updated(const HumanVerificationUpdated &event)
{
    INFO_LOG("HumanVerificationUpdated profile=%s is_verified=%s new_tiger_score=%u",
             event.profile_address().c_str(),
             event.is_verified() ? "true" : "false",
             event.new_tiger_score());
}

void LoggingEventSink::on_reputation_factors_updated(const ReputationFactorsUpdated &event)
{
    INFO_LOG("ReputationFactorsUpdated profile=%s new_tiger_score=%u new_level_up_tier=%u",
             event.profile_address().c_str(),
             event.new_tiger_score(),
             event.new_level_up_tier());
}

void LoggingEventSink::on_tiger_score_overridden(const TigerScoreOverridden &event)
{
    INFO_LOG("TigerScoreUpdated profile=%s requested_score=%u new_score=%u new_tier=%u",
             event.profile_address().c_str(),
             event.requested_score(),
             event.new_score(),
             event.new_tier());
}

void EventCollector::on_profile_initialized(const ProfileInitialized &event)
{
    LedgerEvent ledger_event;
    *ledger_event.mutable_profile_initialized() = event;
    add_event(ledger_event);
    if (next_ != nullptr)
        next_->on_profile_initialized(event);
}

void EventCollector::on_human_verification_updated(const HumanVerificationUpdated &event)
{
    LedgerEvent ledger_event;
    *ledger_event.mutable_human_verification_updated() = event;
    add_event(ledger_event);
    if (next_ != nullptr)
        next_->on_human_verification_updated(event);
}

void EventCollector::on_reputation_factors_updated(const ReputationFactorsUpdated &event)
{
    LedgerEvent ledger_event;
    *ledger_event.mutable_reputation_factors_updated() = event;
    add_event(ledger_event);
    if (next_ != nullptr)
        next_->on_reputation_factors_updated(event);
}

void EventCollector::on_tiger_score_overridden(const TigerScoreOverridden &event)
{
    LedgerEvent ledger_event;
    *ledger_event.mutable_tiger_score_overridden() = event;
    add_event(ledger_event);
    if (next_ != nullptr)
        next_->on_tiger_score_overridden(event);
}

void EventCollector::add_event(const LedgerEvent &event)
{
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(event);
}

std::vector<LedgerEvent> EventCollector::events() const
{
    std::lock_guard<std::mutex> lock(events_mutex_);
    return events_;
}

std::vector<LedgerEvent> EventCollector::take_events()
{
    std::vector<LedgerEvent> events;
    std::lock_guard<std::mutex> lock(events_mutex_);
    events.swap(events_);
    return events;
}

} // namespace ledger
} // namespace tigerscore
