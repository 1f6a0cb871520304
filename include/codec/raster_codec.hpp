#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "io/image_types.hpp"

namespace ppmsteg {

// Parse a complete P6 buffer. Throws StegError(ErrorKind::Format) on any
// deviation from the layout in format/ppm_format.hpp, including trailing or
// missing pixel bytes. id is only used as a label in errors and on the result.
RasterImage parse_ppm(const std::vector<uint8_t>& bytes, const std::string& id = "");

// header_bytes followed by pixel_bytes. Inverse of parse_ppm for an
// unmodified image. Throws StegError(ErrorKind::Format) if the pixel buffer
// does not match the dimensions.
std::vector<uint8_t> serialize_ppm(const RasterImage& im);

// Deep copy; the result shares no storage with im.
RasterImage clone_image(const RasterImage& im);

} // namespace ppmsteg
