#pragma once

#include <cstddef>
#include <cstdint>
#include "io/image_types.hpp"

namespace ppmsteg {

// Pixel-domain comparison of a cover image and its stego counterpart.
struct Distortion {
    size_t compared_bytes = 0;
    size_t changed_bytes = 0;   // pixel bytes that differ at all
    uint32_t max_abs_diff = 0;
    bool header_equal = false;
    double mse = 0.0;
    double rmse = 0.0;
    double psnr = 0.0;          // +inf when identical
};

// Both images must have the same dimensions (std::runtime_error otherwise).
Distortion compare_images(const RasterImage& cover, const RasterImage& stego);

} // namespace ppmsteg
