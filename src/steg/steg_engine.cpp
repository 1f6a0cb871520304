#include "steg/steg_engine.hpp"

#include "bits/bit_channel.hpp"
#include "bits/byte_stream.hpp"
#include "codec/raster_codec.hpp"
#include "format/ppm_format.hpp"
#include "steg/steg_error.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace ppmsteg {

namespace {
static std::vector<uint8_t> frame_payload(const std::vector<uint8_t>& message) {
    ByteWriter w;
    w.reserve(kStegOverheadBytes + message.size());
    w.write_bytes(kStegMagic, kStegMagicBytes);
    w.write_bytes(message);
    w.write_u8(kStegTerminator);
    return w.take();
}
} // namespace

bool check_magic(const RasterImage& im) {
    const auto probe = unpack_bits(im.pixel_bytes, 0, kStegMagicBytes);
    return probe.size() == kStegMagicBytes &&
           std::equal(probe.begin(), probe.end(), kStegMagic);
}

size_t max_message_bytes(const RasterImage& im) {
    const size_t cap = capacity_bytes(im.pixel_bytes.size());
    return cap > kStegOverheadBytes ? cap - kStegOverheadBytes : 0;
}

RasterImage hide(const RasterImage& im, const std::vector<uint8_t>& message) {
    if (check_magic(im)) {
        throw StegError(ErrorKind::AlreadyHidden, im.id, "image already contains a hidden message");
    }
    const size_t cap = capacity_bytes(im.pixel_bytes.size());
    if (kStegOverheadBytes + message.size() > cap) {
        throw StegError(ErrorKind::Capacity, im.id,
                        "message of " + std::to_string(message.size()) +
                        " bytes too big to be hidden in image (capacity " +
                        std::to_string(max_message_bytes(im)) + " bytes)");
    }
    // a zero byte would end the message early on unhide
    if (std::find(message.begin(), message.end(), kStegTerminator) != message.end()) {
        throw std::invalid_argument("hide: message must not contain a zero byte");
    }

    RasterImage out = clone_image(im);
    pack_bits(frame_payload(message), out.pixel_bytes, 0);
    return out;
}

std::vector<uint8_t> unhide(const RasterImage& im) {
    if (!check_magic(im)) {
        throw StegError(ErrorKind::NoMessage, im.id, "image does not have a message");
    }
    auto msg = unpack_until_terminator(im.pixel_bytes, kStegMagicBytes * kBitsPerByte);
    if (!msg) {
        throw StegError(ErrorKind::CorruptMessage, im.id, "bad message (terminator not found)");
    }
    return std::move(*msg);
}

RasterImage hide_text(const RasterImage& im, const std::string& message) {
    return hide(im, std::vector<uint8_t>(message.begin(), message.end()));
}

std::string unhide_text(const RasterImage& im) {
    const auto bytes = unhide(im);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace ppmsteg
