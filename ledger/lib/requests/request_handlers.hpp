/*
 * Entry points for ledger requests
 */

#pragma once

#include <functional>
#include <string>

#include "include/tiger_status_codes.h"

#include "lib/profile/profile_events.hpp"
#include "lib/profile/profile_ledger.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#include "proto/requests.pb.h"
#pragma GCC diagnostic pop

namespace tigerscore
{
namespace ledger
{

// Runs the logic, turning any exception into a status code
TigerStatusCode capture_exceptions(const std::function<void()> &logic, std::string *message);

// Dispatches a request to the ledger. The ledger must report its events to collector.
// Requests sharing a collector run one at a time. Failures are reported through the status fields of the response, never thrown.
LedgerResponse
handle_request(ProfileLedger &ledger, EventCollector &collector, const LedgerRequest &request);

// As above, for a serialized LedgerRequest
LedgerResponse
handle_request_bytes(ProfileLedger &ledger, EventCollector &collector, const std::string &bytes);

} // namespace ledger
} // namespace tigerscore
