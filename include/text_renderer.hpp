//
//  text_renderer.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_STROKER_H

#include <string>

#include "rgba_image.hpp"
#include "subtitle_options.hpp"

/**
 * @brief Rasterizes one caption line onto a full-frame transparent canvas.
 *
 * Owns a FreeType library, one face and one stroker. The face is loaded once from the
 * configured font file and re-sized per call, so a single renderer serves a whole burn.
 */
class TextRenderer {
public:
    explicit TextRenderer(const std::string &font_path);
    ~TextRenderer();

    TextRenderer(const TextRenderer &) = delete;
    TextRenderer &operator=(const TextRenderer &) = delete;

    /// True when the font loaded; otherwise error() says why.
    bool ok() const { return face_ != nullptr; }
    const std::string &error() const { return error_; }

    /**
     * @brief Clear `image` and draw `text` centred on it.
     *
     * The text is normalized per `options` (alnum filter, then capitalization) and drawn at
     * `scaled_font_size(options.font_size, scale)` pixels: outline first, fill on top.
     * A size of zero or an empty string leaves the image transparent.
     *
     * @return false when FreeType rejects the size or a glyph could not be rendered.
     */
    bool render(const std::string &text, double scale, const SubtitleOptions &options,
                RgbaImage &image);

    /// Text after the options' normalization steps.
    static std::string prepare_text(const std::string &text, const SubtitleOptions &options);

    /// Pixel size for `font_size` at animation `scale` (truncated, never negative).
    static int scaled_font_size(int font_size, double scale);

private:
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    FT_Stroker stroker_ = nullptr;
    std::string error_;
};
