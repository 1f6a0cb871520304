#include "steg/steg_error.hpp"

namespace ppmsteg {

namespace {
std::string format_what(ErrorKind kind, const std::string& id, const std::string& detail) {
    std::string s = error_code(kind);
    s += ": ";
    if (!id.empty()) {
        s += id;
        s += ": ";
    }
    s += detail;
    return s;
}
} // namespace

const char* error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Format:         return "BAD_FORMAT";
        case ErrorKind::Capacity:       return "STEG_TOO_BIG";
        case ErrorKind::AlreadyHidden:  return "STEG_MSG";
        case ErrorKind::NoMessage:      return "STEG_NO_MSG";
        case ErrorKind::CorruptMessage: return "STEG_BAD_MSG";
    }
    return "UNKNOWN";
}

StegError::StegError(ErrorKind kind, const std::string& id, const std::string& detail)
    : std::runtime_error(format_what(kind, id, detail)), kind_(kind) {}

} // namespace ppmsteg
