#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ppmsteg {

// Writes one payload bit into the LSB of each successive cover byte.
class LsbWriter {
public:
    LsbWriter(std::vector<uint8_t>& cover, size_t start_offset)
        : cover_(cover), pos_(start_offset) {}

    void put_bit(bool bit);
    // MSB first.
    void put_byte(uint8_t v);
    size_t pos() const { return pos_; }
    size_t bits_remaining() const { return pos_ < cover_.size() ? cover_.size() - pos_ : 0; }
private:
    std::vector<uint8_t>& cover_;
    size_t pos_;
};

// Reads payload bits back out of the LSBs. Only whole groups of 8 cover
// bytes count: a trailing partial group never yields a byte.
class LsbReader {
public:
    LsbReader(const std::vector<uint8_t>& cover, size_t start_offset);

    bool get_bit();
    uint8_t get_byte();
    bool has_byte() const { return pos_ + 8 <= limit_; }
    size_t bits_remaining() const { return pos_ < limit_ ? limit_ - pos_ : 0; }
private:
    const std::vector<uint8_t>& cover_;
    size_t pos_;
    size_t limit_; // floor(cover.size() / 8) * 8
};

// Number of payload bytes that fit in pixel_byte_count cover bytes.
size_t capacity_bytes(size_t pixel_byte_count);

// Caller guarantees start_offset + 8 * payload.size() <= buffer.size();
// violating it throws std::runtime_error before anything is written.
void pack_bits(const std::vector<uint8_t>& payload,
               std::vector<uint8_t>& buffer,
               size_t start_offset);

// Bounded read: max_bytes bytes regardless of their value, fewer only when
// the buffer runs out.
std::vector<uint8_t> unpack_bits(const std::vector<uint8_t>& buffer,
                                 size_t start_offset,
                                 size_t max_bytes);

// Unbounded read up to (excluding) the first zero byte.
// std::nullopt if the buffer runs out before a zero byte is produced.
std::optional<std::vector<uint8_t>> unpack_until_terminator(const std::vector<uint8_t>& buffer,
                                                            size_t start_offset);

} // namespace ppmsteg
