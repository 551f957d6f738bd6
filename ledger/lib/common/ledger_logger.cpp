#include "lib/common/ledger_logger.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

#include "lib/common/encoders.hpp"
#include "lib/common/ledger_exception.hpp"

namespace tigerscore
{
namespace ledger
{

namespace
{

LogLevel min_log_level = kLogInfo;
std::mutex log_mutex;

const char *level_tag(LogLevel level)
{
    switch (level)
    {
    case kLogDebug:
        return "DEBUG";
    case kLogInfo:
        return "INFO";
    case kLogWarning:
        return "WARNING";
    case kLogError:
        return "ERROR";
    default:
        return "LOG";
    }
}

const char *file_base_name(const char *file)
{
    const char *file_name = strrchr(file, '/');
    return (file_name == nullptr) ? file : file_name + 1;
}

} // namespace

void set_log_level(LogLevel level) { min_log_level = level; }

LogLevel get_log_level() { return min_log_level; }

LogLevel parse_log_level(const std::string &name)
{
    if (name == "debug")
        return kLogDebug;
    if (name == "info")
        return kLogInfo;
    if (name == "warning")
        return kLogWarning;
    if (name == "error")
        return kLogError;

    THROW_EXCEPTION(kConfigurationError, "Unknown log level \"" + name + "\"");
}

void log_message(LogLevel level, const char *file, int line, const char *fmt, ...)
{
    if (level < min_log_level)
        return;

    char buf[BUFSIZ] = {'\0'};
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, BUFSIZ, fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lock(log_mutex);
    fprintf(stderr, "[%s] %s:%i %s\n", level_tag(level), file_base_name(file), line, buf);
}

void log_hex(const char *file, int line, const char *label, const uint8_t *data, size_t size)
{
    if (kLogDebug < min_log_level)
        return;

    const std::string hex = hex_encode(data, size);
    log_message(kLogDebug, file, line, "%s: %s", label, hex.c_str());
}

} // namespace ledger
} // namespace tigerscore
