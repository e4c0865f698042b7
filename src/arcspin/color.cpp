#include <arcspin/color.h>
#include <cctype>
#include <cstdio>

namespace arcspin::color {

uint32_t blend(float fraction, uint32_t from, uint32_t to) {
    auto channel = [fraction](uint32_t s, uint32_t e) -> uint32_t {
        int start = static_cast<int>(s);
        int end = static_cast<int>(e);
        return static_cast<uint32_t>(start + static_cast<int>(fraction * (end - start))) & 0xFF;
    };
    return argb(channel(alpha(from), alpha(to)),
                channel(red(from), red(to)),
                channel(green(from), green(to)),
                channel(blue(from), blue(to)));
}

Result<uint32_t> parseColor(std::string_view str) {
    if (str.empty() || str[0] != '#') {
        return Err<uint32_t>("color must start with '#': " + std::string(str));
    }
    std::string hex(str.substr(1));
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Err<uint32_t>("invalid hex digit in color: " + std::string(str));
        }
    }
    if (hex.size() == 3) {
        hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if (hex.size() == 6) {
        hex = "FF" + hex;
    }
    if (hex.size() != 8) {
        return Err<uint32_t>("color must have 3, 6 or 8 hex digits: " + std::string(str));
    }
    return Ok(static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
}

std::string formatColor(uint32_t c) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%08X", c);
    return buf;
}

} // namespace arcspin::color
