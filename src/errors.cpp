/**
 * @file errors.cpp
 * @brief Error kind names and errno formatting
 */

#include "errors.hpp"
#include <cerrno>
#include <system_error>

namespace dotvid {

const char* error_kind_name(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::IO:
        return "I/O error";
    case ErrorKind::PROCESS:
        return "codec process error";
    case ErrorKind::INTEGRITY:
        return "integrity error";
    case ErrorKind::CONFIG:
        return "configuration error";
    }
    return "error";
}

std::string errno_message(const std::string& what)
{
    const int err = errno;
    return what + ": " + std::system_category().message(err);
}

} // namespace dotvid
