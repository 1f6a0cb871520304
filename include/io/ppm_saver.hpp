#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "io/image_types.hpp"

namespace ppmsteg {

// Overwrites path. Throws std::runtime_error on failure.
void write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes);

// serialize_ppm + write_file_bytes.
void save_ppm(const std::string& path, const RasterImage& im);

} // namespace ppmsteg
