#pragma once

#include <arcspin/result.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace arcspin {

// Colors are packed ARGB: 0xAARRGGBB
namespace color {

static constexpr uint32_t TRANSPARENT = 0x00000000;
static constexpr uint32_t BLACK = 0xFF000000;
static constexpr uint32_t WHITE = 0xFFFFFFFF;
static constexpr uint32_t CYAN = 0xFF00FFFF;

constexpr uint32_t argb(uint32_t a, uint32_t r, uint32_t g, uint32_t b) {
    return ((a & 0xFF) << 24) | ((r & 0xFF) << 16) | ((g & 0xFF) << 8) | (b & 0xFF);
}

constexpr uint32_t alpha(uint32_t c) { return (c >> 24) & 0xFF; }
constexpr uint32_t red(uint32_t c)   { return (c >> 16) & 0xFF; }
constexpr uint32_t green(uint32_t c) { return (c >> 8) & 0xFF; }
constexpr uint32_t blue(uint32_t c)  { return c & 0xFF; }

constexpr uint32_t withAlpha(uint32_t c, uint32_t a) {
    return (c & 0x00FFFFFF) | ((a & 0xFF) << 24);
}

// Channel-wise linear blend; each channel is truncated toward the start value.
uint32_t blend(float fraction, uint32_t from, uint32_t to);

// Accepts "#RGB", "#RRGGBB" (opaque) and "#AARRGGBB".
Result<uint32_t> parseColor(std::string_view str);

// "#AARRGGBB"
std::string formatColor(uint32_t c);

} // namespace color
} // namespace arcspin
