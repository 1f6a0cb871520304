#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "io/image_types.hpp"

namespace ppmsteg {

// Returns a copy of im with "stg" + message + '\0' hidden in the pixel LSBs.
// im itself is never modified.
// Throws StegError: AlreadyHidden, Capacity.
// message must not contain a zero byte (it would end the message early on
// unhide). Such a message is a caller error, outside the StegError kinds,
// and throws std::invalid_argument.
RasterImage hide(const RasterImage& im, const std::vector<uint8_t>& message);

// Throws StegError: NoMessage, CorruptMessage.
std::vector<uint8_t> unhide(const RasterImage& im);

// True if the pixel bytes begin with the hidden "stg" prefix.
bool check_magic(const RasterImage& im);

// Largest message hide() accepts for im (0 if not even the framing fits).
size_t max_message_bytes(const RasterImage& im);

// std::string conveniences; bytes are passed through unchanged.
// hide_text refuses embedded '\0' characters like hide does.
RasterImage hide_text(const RasterImage& im, const std::string& message);
std::string unhide_text(const RasterImage& im);

} // namespace ppmsteg
