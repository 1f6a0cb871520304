#include "metrics/distortion.hpp"

#include "format/ppm_format.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ppmsteg {

Distortion compare_images(const RasterImage& cover, const RasterImage& stego) {
    if (cover.width != stego.width || cover.height != stego.height) {
        throw std::runtime_error("compare_images: dimensions mismatch");
    }
    if (cover.pixel_bytes.size() != stego.pixel_bytes.size()) {
        throw std::runtime_error("compare_images: pixel buffer size mismatch");
    }

    Distortion d;
    d.compared_bytes = cover.pixel_bytes.size();
    d.header_equal = (cover.header_bytes == stego.header_bytes);

    double sq = 0.0;
    for (size_t i = 0; i < cover.pixel_bytes.size(); ++i) {
        const int a = cover.pixel_bytes[i];
        const int b = stego.pixel_bytes[i];
        const uint32_t e = static_cast<uint32_t>(a > b ? a - b : b - a);
        if (e != 0) ++d.changed_bytes;
        d.max_abs_diff = std::max(d.max_abs_diff, e);
        sq += static_cast<double>(e) * static_cast<double>(e);
    }

    if (d.compared_bytes > 0) d.mse = sq / static_cast<double>(d.compared_bytes);
    d.rmse = std::sqrt(d.mse);
    if (d.mse == 0.0) {
        d.psnr = std::numeric_limits<double>::infinity();
    } else {
        d.psnr = 20.0 * std::log10(static_cast<double>(kPpmMaxColorValue)) - 10.0 * std::log10(d.mse);
    }
    return d;
}

} // namespace ppmsteg
