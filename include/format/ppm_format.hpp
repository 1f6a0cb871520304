#pragma once

#include <cstddef>
#include <cstdint>

namespace ppmsteg {

// Binary PPM (P6) layout accepted by the codec:
//   [magic "P6"][ws*][width][ws+][height][ws+][maxval][1 separator byte][pixels...]
//
// ws is one of ' ', '\t', '\n', '\r'. No '#' comments.
// Pixel data is exactly 3 * width * height bytes (RGB, row-major).
inline constexpr uint8_t kPpmMagic0 = 'P';
inline constexpr uint8_t kPpmMagic1 = '6';
inline constexpr int kPpmMaxColorValue = 255;
inline constexpr size_t kPpmChannels = 3;

inline bool is_ppm_space(uint8_t b) {
    return b == ' ' || b == '\t' || b == '\n' || b == '\r';
}

inline bool is_ppm_digit(uint8_t b) {
    return b >= '0' && b <= '9';
}

// Hidden payload framing:
//   [kStegMagic (3 bytes)][message bytes...][kStegTerminator]
// Each payload byte occupies the LSB of 8 consecutive pixel bytes, MSB first.
inline constexpr uint8_t kStegMagic[] = {'s', 't', 'g'};
inline constexpr size_t kStegMagicBytes = sizeof(kStegMagic);
inline constexpr uint8_t kStegTerminator = 0;
inline constexpr size_t kStegOverheadBytes = kStegMagicBytes + 1;
inline constexpr size_t kBitsPerByte = 8;

} // namespace ppmsteg
