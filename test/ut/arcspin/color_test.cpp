//=============================================================================
// Color helper tests: packing, ARGB blending, hex parsing
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <arcspin/color.h>

using namespace boost::ut;
using namespace arcspin;

suite color_pack_tests = [] {
    "argb packs channels"_test = [] {
        expect(color::argb(0x12, 0x34, 0x56, 0x78) == 0x12345678u);
        expect(color::alpha(0x12345678u) == 0x12u);
        expect(color::red(0x12345678u) == 0x34u);
        expect(color::green(0x12345678u) == 0x56u);
        expect(color::blue(0x12345678u) == 0x78u);
    };

    "withAlpha replaces only alpha"_test = [] {
        expect(color::withAlpha(0xFF00FFFFu, 0x80) == 0x8000FFFFu);
        expect(color::withAlpha(0x00123456u, 255) == 0xFF123456u);
    };
};

suite color_blend_tests = [] {
    "blend endpoints are exact"_test = [] {
        expect(color::blend(0.0f, 0xFFFF0000u, 0xFF0000FFu) == 0xFFFF0000u);
        expect(color::blend(1.0f, 0xFFFF0000u, 0xFF0000FFu) == 0xFF0000FFu);
    };

    "blend truncates each channel toward the start"_test = [] {
        // 0.5 * 255 = 127.5 -> 127 up, 255 - 127 = 128 down
        uint32_t c = color::blend(0.5f, 0xFFFF0000u, 0xFF0000FFu);
        expect(color::red(c) == 128u);
        expect(color::blue(c) == 127u);
        expect(color::alpha(c) == 255u);
    };

    "blend interpolates alpha"_test = [] {
        uint32_t c = color::blend(0.25f, 0x00000000u, 0xFF000000u);
        expect(color::alpha(c) == 63u);
    };
};

suite color_parse_tests = [] {
    "parses 8 digit ARGB"_test = [] {
        auto c = color::parseColor("#80FF0000");
        expect(c.has_value());
        expect(*c == 0x80FF0000u);
    };

    "6 digits are opaque"_test = [] {
        auto c = color::parseColor("#00ff00");
        expect(c.has_value());
        expect(*c == 0xFF00FF00u);
    };

    "3 digits expand"_test = [] {
        auto c = color::parseColor("#F0A");
        expect(c.has_value());
        expect(*c == 0xFFFF00AAu);
    };

    "rejects malformed input"_test = [] {
        expect(!color::parseColor("").has_value());
        expect(!color::parseColor("FF0000").has_value());
        expect(!color::parseColor("#GG0000").has_value());
        expect(!color::parseColor("#12345").has_value());
    };

    "format round trips through parse"_test = [] {
        expect(color::formatColor(0xFF00FFFFu) == std::string("#FF00FFFF"));
        auto c = color::parseColor(color::formatColor(0x7F102030u));
        expect(c.has_value());
        expect(*c == 0x7F102030u);
    };
};
