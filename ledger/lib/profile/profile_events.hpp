/*
 * Notifications emitted after a profile changes
 */

#pragma once

#include <mutex>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#pragma GCC diagnostic pop

namespace tigerscore
{
namespace ledger
{

class ProfileEventSink
{
public:
    virtual ~ProfileEventSink() {}

    virtual void on_profile_initialized(const ProfileInitialized &event) = 0;
    virtual void on_human_verification_updated(const HumanVerificationUpdated &event) = 0;
    virtual void on_reputation_factors_updated(const ReputationFactorsUpdated &event) = 0;
    virtual void on_tiger_score_overridden(const TigerScoreOverridden &event) = 0;
};

class LoggingEventSink : public ProfileEventSink
{
public:
    void on_profile_initialized(const ProfileInitialized &event) override;
    void on_human_verification_updated(const HumanVerificationUpdated &event) override;
    void on_reputation_factors_updated(const ReputationFactorsUpdated &event) override;
    void on_tiger_score_overridden(const TigerScoreOverridden &event) override;
};

// Keeps every event as a LedgerEvent, optionally passing each one on to another sink.
// The event list is safe to share between threads. A caller that needs the events of
// one request only holds lock_requests() from its first take_events() to its last.
class EventCollector : public ProfileEventSink
{
public:
    explicit EventCollector(ProfileEventSink *next = nullptr) : next_(next) {}

    void on_profile_initialized(const ProfileInitialized &event) override;
    void on_human_verification_updated(const HumanVerificationUpdated &event) override;
    void on_reputation_factors_updated(const ReputationFactorsUpdated &event) override;
    void on_tiger_score_overridden(const TigerScoreOverridden &event) override;

    std::vector<LedgerEvent> events() const;
    // Returns the collected events and starts over with an empty list
    std::vector<LedgerEvent> take_events();

    std::unique_lock<std::mutex> lock_requests()
    {
        return std::unique_lock<std::mutex>(request_mutex_);
    }

private:
    void add_event(const LedgerEvent &event);

    ProfileEventSink *next_;
    std::vector<LedgerEvent> events_;
    mutable std::mutex events_mutex_;
    std::mutex request_mutex_;
};

} // namespace ledger
} // namespace tigerscore
