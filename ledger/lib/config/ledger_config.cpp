#include "lib/config/ledger_config.hpp"

#include <fstream>
#include <sstream>

#include <google/protobuf/util/json_util.h>

#include "include/tiger_constants.h"

#include "lib/common/decoders.hpp"
#include "lib/common/ledger_exception.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "proto/messages.pb.h"
#pragma GCC diagnostic pop

namespace tigerscore
{
namespace ledger
{

namespace
{

PublicKey config_key(const std::string &value, const char *field_name)
{
    try
    {
        return public_key_from_string(value);
    }
    catch (const LedgerException &e)
    {
        THROW_EXCEPTION(kConfigurationError,
                        std::string("Invalid key in ") + field_name + ": " + e.what());
    }
}

} // namespace

LedgerSettings parse_ledger_config(const std::string &json)
{
    LedgerConfig config;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok())
        THROW_EXCEPTION(kConfigurationError, "Cannot parse configuration: " + status.ToString());

    LedgerSettings settings;

    if (config.admin_authorities_size() == 0)
        THROW_EXCEPTION(kConfigurationError, "admin_authorities must not be empty");
    for (const std::string &authority : config.admin_authorities())
        settings.admin_authorities.push_back(config_key(authority, "admin_authorities"));

    if (config.program_id().empty())
        THROW_EXCEPTION(kConfigurationError, "program_id is required");
    settings.program_id = config_key(config.program_id(), "program_id");

    settings.profile_seed =
        config.profile_seed().empty() ? TIGER_DEFAULT_PROFILE_SEED : config.profile_seed();

    if (!config.log_level().empty())
        settings.log_level = parse_log_level(config.log_level());

    return settings;
}

LedgerSettings load_ledger_config(const std::string &path)
{
    std::ifstream file(path);
    if (!file)
        THROW_EXCEPTION(kConfigurationError, "Cannot open configuration file " + path);

    std::stringstream contents;
    contents << file.rdbuf();
    return parse_ledger_config(contents.str());
}

} // namespace ledger
} // namespace tigerscore
