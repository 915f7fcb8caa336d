//
//  subtitle_options.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "animation.hpp"
#include "color.hpp"

inline constexpr const char *kDefaultFontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

// Upper bound for pixel-valued options (font_size, stroke_width), from the CLI or a style file.
inline constexpr int kMaxPixelOption = 100000;

/// @ingroup api
/// Look of the burned captions. Fixed for the duration of one burn.
struct SubtitleOptions {
    std::string font_path = kDefaultFontPath;
    int font_size = 96;                           ///< pixels at animation scale 1.0
    RgbaColor font_fill{255, 255, 255, 255};
    bool capitalize = false;
    bool filter_alnum = false;
    int stroke_width = 4;                         ///< pixels; 0 disables the outline
    RgbaColor stroke_fill{0, 0, 0, 255};
    double render_offset = 0.0;                   ///< seconds the overlay stream is delayed by
    AnimationKind animation = AnimationKind::Pop;
};

// Apply the keys present in a style JSON document on top of `options`. Unknown keys are
// ignored with a warning; a key with the wrong type or an unparsable colour fails the load.
bool parse_style_json(const std::string &json_text, SubtitleOptions &options);

// Same as parse_style_json, reading from a file.
bool load_style_file(const std::string &path, SubtitleOptions &options);

// Effective style as pretty-printed JSON (same keys parse_style_json accepts).
std::string style_to_json(const SubtitleOptions &options);
