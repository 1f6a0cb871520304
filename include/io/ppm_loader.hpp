#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "io/image_types.hpp"

namespace ppmsteg {

// Whole file as bytes. Throws std::runtime_error if it cannot be opened or read.
std::vector<uint8_t> read_file_bytes(const std::string& path);

// read_file_bytes + parse_ppm; the image id is the file name component of path.
RasterImage load_ppm(const std::string& path);

} // namespace ppmsteg
