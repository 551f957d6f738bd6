/*
 * printf-style logging to stderr
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tigerscore
{
namespace ledger
{

enum LogLevel
{
    kLogDebug = 0,
    kLogInfo = 1,
    kLogWarning = 2,
    kLogError = 3
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Throws kConfigurationError for anything other than debug, info, warning or error
LogLevel parse_log_level(const std::string &name);

void log_message(LogLevel level, const char *file, int line, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

void log_hex(const char *file, int line, const char *label, const uint8_t *data, size_t size);

} // namespace ledger
} // namespace tigerscore

#define DEBUG_LOG(...)                                                                             \
    ::tigerscore::ledger::log_message(::tigerscore::ledger::kLogDebug, __FILE__, __LINE__, __VA_ARGS__)
#define INFO_LOG(...)                                                                              \
    ::tigerscore::ledger::log_message(::tigerscore::ledger::kLogInfo, __FILE__, __LINE__, __VA_ARGS__)
#define WARNING_LOG(...)                                                                           \
    ::tigerscore::ledger::log_message(                                                             \
        ::tigerscore::ledger::kLogWarning, __FILE__, __LINE__, __VA_ARGS__)
#define ERROR_LOG(...)                                                                             \
    ::tigerscore::ledger::log_message(::tigerscore::ledger::kLogError, __FILE__, __LINE__, __VA_ARGS__)
#define EXCEPTION_LOG(e) ERROR_LOG("%s", (e).what())
#define DEBUG_HEX_LOG(label, data, size)                                                           \
    ::tigerscore::ledger::log_hex(__FILE__, __LINE__, label, data, static_cast<size_t>(size))
