#include "bits/bit_channel.hpp"

#include "format/ppm_format.hpp"

#include <stdexcept>
#include <string>

namespace ppmsteg {

void LsbWriter::put_bit(bool bit) {
    if (pos_ >= cover_.size()) throw std::runtime_error("bit_channel: write past end of cover");
    uint8_t& b = cover_[pos_++];
    b = static_cast<uint8_t>((b & 0xFEu) | (bit ? 1u : 0u));
}

void LsbWriter::put_byte(uint8_t v) {
    for (int i = 7; i >= 0; --i) {
        put_bit(((v >> i) & 1u) != 0);
    }
}

LsbReader::LsbReader(const std::vector<uint8_t>& cover, size_t start_offset)
    : cover_(cover), pos_(start_offset), limit_(cover.size() / kBitsPerByte * kBitsPerByte) {}

bool LsbReader::get_bit() {
    if (pos_ >= limit_) throw std::runtime_error("bit_channel: read past end of cover");
    return (cover_[pos_++] & 1u) != 0;
}

uint8_t LsbReader::get_byte() {
    if (!has_byte()) throw std::runtime_error("bit_channel: read past end of cover");
    uint8_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = static_cast<uint8_t>((v << 1) | (get_bit() ? 1u : 0u));
    }
    return v;
}

size_t capacity_bytes(size_t pixel_byte_count) {
    return pixel_byte_count / kBitsPerByte;
}

void pack_bits(const std::vector<uint8_t>& payload,
               std::vector<uint8_t>& buffer,
               size_t start_offset) {
    const size_t need = payload.size() * kBitsPerByte;
    if (start_offset > buffer.size() || need > buffer.size() - start_offset) {
        throw std::runtime_error("pack_bits: payload of " + std::to_string(payload.size()) +
                                 " bytes does not fit at offset " + std::to_string(start_offset));
    }
    LsbWriter w(buffer, start_offset);
    for (uint8_t b : payload) w.put_byte(b);
}

std::vector<uint8_t> unpack_bits(const std::vector<uint8_t>& buffer,
                                 size_t start_offset,
                                 size_t max_bytes) {
    std::vector<uint8_t> out;
    LsbReader r(buffer, start_offset);
    while (out.size() < max_bytes && r.has_byte()) {
        out.push_back(r.get_byte());
    }
    return out;
}

std::optional<std::vector<uint8_t>> unpack_until_terminator(const std::vector<uint8_t>& buffer,
                                                            size_t start_offset) {
    std::vector<uint8_t> out;
    LsbReader r(buffer, start_offset);
    while (r.has_byte()) {
        const uint8_t b = r.get_byte();
        if (b == kStegTerminator) return out;
        out.push_back(b);
    }
    return std::nullopt;
}

} // namespace ppmsteg
