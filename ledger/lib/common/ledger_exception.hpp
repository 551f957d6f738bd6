#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

#include "include/tiger_status_codes.h"
#include "include/tiger_status_message.h"

namespace tigerscore
{
namespace ledger
{

class LedgerException : public std::runtime_error
{
    std::string message_;
    TigerStatusCode code_;

    static const char *base_name(const char *file)
    {
        const char *file_name = strrchr(file, '/');
        return (file_name == nullptr) ? file : file_name + 1;
    }

public:
    LedgerException(
        TigerStatusCode code, const std::string &info, const char *file, const char *func, int line)
        : std::runtime_error(info), code_(code)
    {
        message_ = std::string(base_name(file)) + ":" + std::string(func) + ":" +
                   std::to_string(line) + ": " + "(" + tiger_status_name(code) + "-" +
                   std::to_string(static_cast<int>(code)) + ") " + info;
    }

    LedgerException(TigerStatusCode code, const char *file, const char *func, int line)
        : std::runtime_error(tiger_status_message(code)), code_(code)
    {
        message_ = std::string(base_name(file)) + ":" + std::string(func) + ":" +
                   std::to_string(line) + ": " + tiger_status_message(code);
    }

    const char *what() const throw() { return message_.c_str(); }

    TigerStatusCode get_code() const { return code_; }
};
#define THROW_EXCEPTION(code, arg) throw LedgerException(code, arg, __FILE__, __func__, __LINE__);
#define THROW_ERROR_CODE(code) throw LedgerException(code, __FILE__, __func__, __LINE__);

} // namespace ledger
} // namespace tigerscore
