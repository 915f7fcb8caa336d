//
//  rgba_image.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "color.hpp"

// Tightly packed RGBA8 frame, row-major, no padding; the byte layout ffmpeg's
// `-f rawvideo -pix_fmt rgba` expects.
struct RgbaImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    RgbaImage() = default;
    RgbaImage(uint32_t w, uint32_t h)
        : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

    size_t byte_size() const { return pixels.size(); }

    // Back to fully transparent.
    void clear();

    // Source-over blend of `color` at `coverage` (0..255) into pixel (x, y). Out-of-range
    // coordinates are ignored.
    void blend(int x, int y, const RgbaColor &color, uint8_t coverage);

    bool is_blank() const;
};
