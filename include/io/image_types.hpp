#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ppmsteg {

// Parsed P6 image. Both buffers are owned by value, so copying an image
// never aliases another image's storage.
struct RasterImage {
    std::string id;           // diagnostic label (file name), never serialized
    int width = 0;
    int height = 0;
    int max_color_value = 0;  // 255 only
    std::vector<uint8_t> header_bytes; // magic .. separator, verbatim
    std::vector<uint8_t> pixel_bytes;  // 3 * width * height

    size_t expected_pixel_bytes() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * 3u;
    }
    size_t size() const { return header_bytes.size() + pixel_bytes.size(); }
};

} // namespace ppmsteg
