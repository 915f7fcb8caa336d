//
//  rgba_image.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "rgba_image.hpp"

#include <algorithm>
#include <cmath>

void RgbaImage::clear() { std::fill(pixels.begin(), pixels.end(), 0); }

void RgbaImage::blend(int x, int y, const RgbaColor &color, uint8_t coverage) {
    if (x < 0 || y < 0 || static_cast<uint32_t>(x) >= width ||
        static_cast<uint32_t>(y) >= height) {
        return;
    }
    const float src_a = (color.a / 255.0f) * (coverage / 255.0f);
    if (src_a <= 0.0f) {
        return;
    }
    uint8_t *dst = &pixels[(static_cast<size_t>(y) * width + static_cast<size_t>(x)) * 4];
    const float dst_a = dst[3] / 255.0f;
    const float out_a = src_a + dst_a * (1.0f - src_a);
    auto channel = [&](uint8_t s, uint8_t d) {
        float v = (s * src_a + d * dst_a * (1.0f - src_a)) / out_a;
        return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    };
    dst[0] = channel(color.r, dst[0]);
    dst[1] = channel(color.g, dst[1]);
    dst[2] = channel(color.b, dst[2]);
    dst[3] = static_cast<uint8_t>(std::clamp(std::lround(out_a * 255.0f), 0L, 255L));
}

bool RgbaImage::is_blank() const {
    return std::all_of(pixels.begin(), pixels.end(), [](uint8_t b) { return b == 0; });
}
