#include "bits/bit_channel.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace ppmsteg {
namespace {

std::vector<uint8_t> lsbs(const std::vector<uint8_t>& buf, size_t from, size_t n) {
    std::vector<uint8_t> out;
    for (size_t i = from; i < from + n; ++i) out.push_back(static_cast<uint8_t>(buf[i] & 1u));
    return out;
}

TEST(BitChannelTest, CapacityIsOneBytePerEightPixelBytes) {
    EXPECT_EQ(capacity_bytes(0), 0u);
    EXPECT_EQ(capacity_bytes(6), 0u);
    EXPECT_EQ(capacity_bytes(7), 0u);
    EXPECT_EQ(capacity_bytes(8), 1u);
    EXPECT_EQ(capacity_bytes(15), 1u);
    EXPECT_EQ(capacity_bytes(30000), 3750u);
}

TEST(BitChannelTest, PackWritesMsbFirstIntoLsbs) {
    std::vector<uint8_t> buf(8, 0x00);
    pack_bits({0xA5}, buf, 0);
    EXPECT_EQ(lsbs(buf, 0, 8), (std::vector<uint8_t>{1, 0, 1, 0, 0, 1, 0, 1}));
}

TEST(BitChannelTest, PackPreservesUpperSevenBits) {
    std::vector<uint8_t> buf = {0xFF, 0xFE, 0x81, 0x80, 0x7F, 0x00, 0x42, 0x43};
    const auto before = buf;
    pack_bits({0x0F}, buf, 0);
    for (size_t i = 0; i < buf.size(); ++i) {
        EXPECT_EQ(buf[i] & 0xFE, before[i] & 0xFE) << "byte " << i;
    }
    EXPECT_EQ(lsbs(buf, 0, 8), (std::vector<uint8_t>{0, 0, 0, 0, 1, 1, 1, 1}));
}

TEST(BitChannelTest, PackHonoursStartOffset) {
    std::vector<uint8_t> buf(24, 0xFF);
    pack_bits({0x00}, buf, 8);
    EXPECT_EQ(lsbs(buf, 0, 8), std::vector<uint8_t>(8, 1));
    EXPECT_EQ(lsbs(buf, 8, 8), std::vector<uint8_t>(8, 0));
    EXPECT_EQ(lsbs(buf, 16, 8), std::vector<uint8_t>(8, 1));
}

TEST(BitChannelTest, PackRefusesToOverrun) {
    std::vector<uint8_t> buf(15, 0x10);
    const auto before = buf;
    EXPECT_THROW(pack_bits({1, 2}, buf, 0), std::runtime_error);
    EXPECT_THROW(pack_bits({1}, buf, 8), std::runtime_error);
    EXPECT_THROW(pack_bits({1}, buf, 100), std::runtime_error);
    EXPECT_EQ(buf, before);
    EXPECT_NO_THROW(pack_bits({1}, buf, 7));
}

TEST(BitChannelTest, BoundedUnpackIgnoresZeroBytes) {
    std::vector<uint8_t> buf(40, 0x20);
    pack_bits({'a', 0, 'b', 0, 'c'}, buf, 0);
    EXPECT_EQ(unpack_bits(buf, 0, 3), (std::vector<uint8_t>{'a', 0, 'b'}));
    EXPECT_EQ(unpack_bits(buf, 8, 2), (std::vector<uint8_t>{0, 'b'}));
    EXPECT_TRUE(unpack_bits(buf, 0, 0).empty());
}

TEST(BitChannelTest, BoundedUnpackStopsAtEndOfBuffer) {
    std::vector<uint8_t> buf(20, 0x01); // two whole bytes, four spare pixel bytes
    EXPECT_EQ(unpack_bits(buf, 0, 3), (std::vector<uint8_t>{0xFF, 0xFF}));
    EXPECT_TRUE(unpack_bits(std::vector<uint8_t>(6, 0x01), 0, 3).empty());
}

TEST(BitChannelTest, UnboundedUnpackStopsAtTerminator) {
    std::vector<uint8_t> buf(64, 0xFF);
    pack_bits({'h', 'i', 0}, buf, 0);
    auto msg = unpack_until_terminator(buf, 0);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, (std::vector<uint8_t>{'h', 'i'}));

    auto tail = unpack_until_terminator(buf, 8);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, (std::vector<uint8_t>{'i'}));
}

TEST(BitChannelTest, UnboundedUnpackReportsUnterminated) {
    std::vector<uint8_t> buf(24, 0x00);
    pack_bits({'x', 'y', 'z'}, buf, 0);
    EXPECT_FALSE(unpack_until_terminator(buf, 0).has_value());
}

TEST(BitChannelTest, PartialTrailingGroupNeverYieldsAByte) {
    // two whole bytes 'o','k' followed by 7 pixel bytes whose LSBs are all 0
    std::vector<uint8_t> buf(23, 0x00);
    pack_bits({'o', 'k'}, buf, 0);
    EXPECT_FALSE(unpack_until_terminator(buf, 0).has_value());
}

TEST(BitChannelTest, ReaderAndWriterCursors) {
    std::vector<uint8_t> buf(16, 0x00);
    LsbWriter w(buf, 0);
    w.put_bit(true);
    w.put_byte(0x80);
    EXPECT_EQ(w.pos(), 9u);
    EXPECT_EQ(w.bits_remaining(), 7u);

    LsbReader r(buf, 0);
    EXPECT_TRUE(r.get_bit());
    EXPECT_EQ(r.get_byte(), 0x80);
    EXPECT_EQ(r.bits_remaining(), 7u);
    EXPECT_FALSE(r.has_byte());
    EXPECT_THROW(r.get_byte(), std::runtime_error);
}

} // namespace
} // namespace ppmsteg
