//
//  color.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

/// Straight (non-premultiplied) 8-bit RGBA colour.
struct RgbaColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const RgbaColor &o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
};

// Parse "#RRGGBB", "#RRGGBBAA" or a named colour (white, black, red, green, blue, yellow,
// transparent). Case-insensitive.
std::optional<RgbaColor> parse_color(const std::string &text);

// "#RRGGBBAA" form, used when dumping the effective style.
std::string format_color(const RgbaColor &color);
