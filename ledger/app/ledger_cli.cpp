#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "include/tiger_status_codes.h"
#include "include/tiger_status_message.h"

#include "lib/common/ledger_exception.hpp"
#include "lib/common/ledger_logger.hpp"
#include "lib/config/ledger_config.hpp"
#include "lib/profile/authority_set.hpp"
#include "lib/profile/memory_profile_store.hpp"
#include "lib/profile/profile_address.hpp"
#include "lib/profile/profile_events.hpp"
#include "lib/profile/profile_ledger.hpp"
#include "lib/requests/request_handlers.hpp"

using namespace tigerscore::ledger;

namespace
{

void print_usage(const char *program)
{
    fprintf(stderr, "Usage: %s <config.json> [requests.jsonl]\n", program);
    fprintf(stderr, "Replays one JSON LedgerRequest per line (stdin if no file is given)\n");
    fprintf(stderr, "and prints one JSON LedgerResponse per line.\n");
}

LedgerResponse decoding_failure(const std::string &message)
{
    LedgerResponse response;
    response.set_status(static_cast<int32_t>(kDecodingError));
    response.set_status_name(tiger_status_name(kDecodingError));
    response.set_message(message);
    return response;
}

// Returns the number of requests that did not succeed
int replay_requests(std::istream &input, ProfileLedger &ledger, EventCollector &collector)
{
    google::protobuf::util::JsonPrintOptions print_options;
    print_options.preserve_proto_field_names = true;

    int failures = 0;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line))
    {
        line_number++;
        if (line.empty() || line[0] == '#')
            continue;

        LedgerResponse response;
        LedgerRequest request;
        const auto parse_status = google::protobuf::util::JsonStringToMessage(line, &request);
        if (parse_status.ok())
        {
            response = handle_request(ledger, collector, request);
        }
        else
        {
            ERROR_LOG("Line %zu is not a LedgerRequest: %s",
                      line_number,
                      parse_status.ToString().c_str());
            response = decoding_failure("Line " + std::to_string(line_number) +
                                        " is not a LedgerRequest");
        }

        if (response.status() != kSuccess)
            failures++;

        std::string output;
        const auto print_status =
            google::protobuf::util::MessageToJsonString(response, &output, print_options);
        if (!print_status.ok())
            THROW_EXCEPTION(kUnknownError, "Cannot print response: " + print_status.ToString());
        std::cout << output << std::endl;
    }
    return failures;
}

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2 || argc > 3)
    {
        print_usage(argv[0]);
        return 2;
    }

    try
    {
        const LedgerSettings settings = load_ledger_config(argv[1]);
        set_log_level(settings.log_level);

        const AuthoritySet authorities(settings.admin_authorities);
        const ProfileAddressDeriver deriver(settings.profile_seed, settings.program_id);
        MemoryProfileStore store;
        LoggingEventSink logging_sink;
        EventCollector collector(&logging_sink);
        ProfileLedger ledger(authorities, deriver, store, collector);

        INFO_LOG("Ledger ready with %zu admin authorities, seed \"%s\"",
                 authorities.size(),
                 deriver.seed().c_str());

        int failures = 0;
        if (argc == 3)
        {
            std::ifstream requests(argv[2]);
            if (!requests)
                THROW_EXCEPTION(kInvalidInput, std::string("Cannot open ") + argv[2]);
            failures = replay_requests(requests, ledger, collector);
        }
        else
        {
            failures = replay_requests(std::cin, ledger, collector);
        }

        INFO_LOG("Replay finished with %i failed requests, %zu profiles stored",
                 failures,
                 store.size());
        return failures == 0 ? 0 : 1;
    }
    catch (const LedgerException &e)
    {
        EXCEPTION_LOG(e);
        return 2;
    }
    catch (const std::exception &e)
    {
        ERROR_LOG("%s", e.what());
        return 2;
    }
}
