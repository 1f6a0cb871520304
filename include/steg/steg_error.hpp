#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ppmsteg {

// Closed set of domain failures. Every one is a deterministic validation
// failure; retrying the same call cannot succeed.
enum class ErrorKind : uint8_t {
    Format = 1,         // not a well-formed P6 image with maxval 255
    Capacity = 2,       // prefix + message + terminator do not fit
    AlreadyHidden = 3,  // pixels already start with the hidden prefix
    NoMessage = 4,      // pixels do not start with the hidden prefix
    CorruptMessage = 5, // prefix found, terminator never found
};

// Stable short code for each kind, e.g. "STEG_TOO_BIG".
const char* error_code(ErrorKind kind);

class StegError : public std::runtime_error {
public:
    // what() == "<code>: <id>: <detail>", or "<code>: <detail>" when id is empty.
    StegError(ErrorKind kind, const std::string& id, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const char* code() const { return error_code(kind_); }
private:
    ErrorKind kind_;
};

} // namespace ppmsteg
