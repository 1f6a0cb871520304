#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ppmsteg {

class ByteWriter {
public:
    void reserve(size_t n) { buf_.reserve(n); }
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    void write_bytes(const std::vector<uint8_t>& v) { buf_.insert(buf_.end(), v.begin(), v.end()); }
    size_t size() const { return buf_.size(); }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

// Non-owning cursor; the underlying buffer must outlive the reader.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    uint8_t peek_u8() const {
        need(1);
        return data_[pos_];
    }
    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }
    size_t pos() const { return pos_; }
    bool eof() const { return pos_ >= size_; }
    size_t remaining() const { return size_ - pos_; }
private:
    void need(size_t n) const {
        if (n > size_ - pos_) throw std::runtime_error("byte_stream: premature EOF");
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace ppmsteg
