#include "codec/raster_codec.hpp"

#include "bits/byte_stream.hpp"
#include "format/ppm_format.hpp"
#include "steg/steg_error.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace ppmsteg {
namespace {

static void require(bool ok, const std::string& id, const std::string& msg) {
    if (!ok) throw StegError(ErrorKind::Format, id, msg);
}

static void skip_ws(ByteReader& r) {
    while (!r.eof() && is_ppm_space(r.peek_u8())) r.read_u8();
}

// Leading whitespace, then one or more digits. Values that do not fit an
// int are rejected rather than wrapped.
static int read_header_int(ByteReader& r, const char* field, const std::string& id) {
    skip_ws(r);
    require(!r.eof() && is_ppm_digit(r.peek_u8()), id, std::string("missing or non-numeric ") + field);
    uint64_t v = 0;
    while (!r.eof() && is_ppm_digit(r.peek_u8())) {
        v = v * 10 + static_cast<uint64_t>(r.read_u8() - '0');
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw StegError(ErrorKind::Format, id, std::string(field) + " out of range");
        }
    }
    return static_cast<int>(v);
}

} // namespace

RasterImage parse_ppm(const std::vector<uint8_t>& bytes, const std::string& id) {
    ByteReader r(bytes);

    require(r.remaining() >= 2, id, "buffer too small for magic");
    const uint8_t m0 = r.read_u8();
    const uint8_t m1 = r.read_u8();
    require(m0 == kPpmMagic0 && m1 == kPpmMagic1, id, "bad magic (only P6 is supported)");

    const int w = read_header_int(r, "width", id);
    const int h = read_header_int(r, "height", id);
    const int maxv = read_header_int(r, "max color value", id);

    // exactly one separator byte between header and pixels, any value
    require(!r.eof(), id, "missing separator before pixel data");
    r.read_u8();
    const size_t header_len = r.pos();

    require(w > 0 && h > 0, id, "invalid size " + std::to_string(w) + "x" + std::to_string(h));
    require(maxv == kPpmMaxColorValue, id, "unsupported max color value " + std::to_string(maxv));

    // w, h <= INT_MAX, so 3*w*h fits in 64 bits
    const uint64_t n = static_cast<uint64_t>(w) * static_cast<uint64_t>(h) * kPpmChannels;
    require(static_cast<uint64_t>(r.remaining()) == n, id,
            "expected " + std::to_string(n) + " pixel bytes, found " + std::to_string(r.remaining()));

    RasterImage im;
    im.id = id;
    im.width = w;
    im.height = h;
    im.max_color_value = maxv;
    im.header_bytes.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(header_len));
    im.pixel_bytes.assign(bytes.begin() + static_cast<std::ptrdiff_t>(header_len), bytes.end());
    return im;
}

std::vector<uint8_t> serialize_ppm(const RasterImage& im) {
    require(!im.header_bytes.empty(), im.id, "image has no header");
    require(im.width > 0 && im.height > 0, im.id, "invalid image size");
    require(im.pixel_bytes.size() == im.expected_pixel_bytes(), im.id, "pixel buffer size mismatch");

    ByteWriter w;
    w.reserve(im.size());
    w.write_bytes(im.header_bytes);
    w.write_bytes(im.pixel_bytes);
    return w.take();
}

RasterImage clone_image(const RasterImage& im) {
    RasterImage out;
    out.id = im.id;
    out.width = im.width;
    out.height = im.height;
    out.max_color_value = im.max_color_value;
    out.header_bytes.assign(im.header_bytes.begin(), im.header_bytes.end());
    out.pixel_bytes.assign(im.pixel_bytes.begin(), im.pixel_bytes.end());
    return out;
}

} // namespace ppmsteg
