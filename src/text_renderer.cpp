//
//  text_renderer.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_renderer.hpp"

#include FT_GLYPH_H

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

#include "logging.hpp"
#include "text_filter.hpp"

namespace {

// A laid-out glyph; owns the FreeType glyph copy.
struct PlacedGlyph {
    FT_Glyph glyph = nullptr;
    FT_Pos pen_x = 0;  // 26.6, relative to the start of the line

    PlacedGlyph() = default;
    PlacedGlyph(FT_Glyph g, FT_Pos x) : glyph(g), pen_x(x) {}
    PlacedGlyph(PlacedGlyph &&other) noexcept : glyph(other.glyph), pen_x(other.pen_x) {
        other.glyph = nullptr;
    }
    PlacedGlyph(const PlacedGlyph &) = delete;
    PlacedGlyph &operator=(const PlacedGlyph &) = delete;
    PlacedGlyph &operator=(PlacedGlyph &&) = delete;
    ~PlacedGlyph() {
        if (glyph) {
            FT_Done_Glyph(glyph);
        }
    }
};

void blit_bitmap(RgbaImage &image, const FT_BitmapGlyph bitmap_glyph, int origin_x, int baseline,
                 const RgbaColor &color) {
    const FT_Bitmap &bitmap = bitmap_glyph->bitmap;
    if (bitmap.pixel_mode != FT_PIXEL_MODE_GRAY) {
        return;
    }
    const int left = origin_x + bitmap_glyph->left;
    const int top = baseline - bitmap_glyph->top;
    for (unsigned int row = 0; row < bitmap.rows; ++row) {
        const unsigned char *src = bitmap.buffer + static_cast<std::ptrdiff_t>(row) * bitmap.pitch;
        for (unsigned int col = 0; col < bitmap.width; ++col) {
            if (src[col] == 0) {
                continue;
            }
            image.blend(left + static_cast<int>(col), top + static_cast<int>(row), color, src[col]);
        }
    }
}

// Render a copy of `glyph` (optionally stroked) and blend it into the image.
bool draw_glyph(RgbaImage &image, FT_Glyph glyph, FT_Stroker stroker, int origin_x, int baseline,
                const RgbaColor &color) {
    FT_Glyph copy = nullptr;
    if (FT_Glyph_Copy(glyph, &copy)) {
        return false;
    }
    if (stroker && copy->format == FT_GLYPH_FORMAT_OUTLINE) {
        // Outer border only; the fill pass covers the interior.
        if (FT_Glyph_StrokeBorder(&copy, stroker, 0, 1)) {
            FT_Done_Glyph(copy);
            return false;
        }
    }
    if (FT_Glyph_To_Bitmap(&copy, FT_RENDER_MODE_NORMAL, nullptr, 1)) {
        FT_Done_Glyph(copy);
        return false;
    }
    blit_bitmap(image, reinterpret_cast<FT_BitmapGlyph>(copy), origin_x, baseline, color);
    FT_Done_Glyph(copy);
    return true;
}

}  // namespace

TextRenderer::TextRenderer(const std::string &font_path) {
    if (FT_Init_FreeType(&library_)) {
        library_ = nullptr;
        error_ = "FreeType initialization failed";
        CB_LOG("error", error_);
        return;
    }
    FT_Error err = FT_New_Face(library_, font_path.c_str(), 0, &face_);
    if (err) {
        face_ = nullptr;
        error_ = "Cannot load font " + font_path + " (FreeType error " + std::to_string(err) + ")";
        CB_LOG("error", error_);
        return;
    }
    if (FT_Stroker_New(library_, &stroker_)) {
        stroker_ = nullptr;
        CB_LOG("warn", "FreeType stroker unavailable; captions will be drawn without outline");
    }
    CB_LOG("debug", "font loaded: " << (face_->family_name ? face_->family_name : "?") << " "
                                    << (face_->style_name ? face_->style_name : "")
                                    << " glyphs=" << face_->num_glyphs);
}

TextRenderer::~TextRenderer() {
    if (stroker_) {
        FT_Stroker_Done(stroker_);
    }
    if (face_) {
        FT_Done_Face(face_);
    }
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

std::string TextRenderer::prepare_text(const std::string &text, const SubtitleOptions &options) {
    std::string out = text;
    if (options.filter_alnum) {
        out = filter_alnum(out);
    }
    if (options.capitalize) {
        out = to_upper_ascii(out);
    }
    return out;
}

int TextRenderer::scaled_font_size(int font_size, double scale) {
    double px = static_cast<double>(font_size) * scale;
    if (!(px > 0.0)) {
        return 0;
    }
    if (px >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(px);
}

bool TextRenderer::render(const std::string &text, double scale, const SubtitleOptions &options,
                          RgbaImage &image) {
    image.clear();
    if (!face_) {
        return false;
    }
    const std::string prepared = prepare_text(text, options);
    const int font_px = scaled_font_size(options.font_size, scale);
    if (font_px <= 0 || prepared.empty()) {
        return true;
    }
    if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(font_px))) {
        CB_LOG("error", "FreeType rejected pixel size " << font_px);
        return false;
    }

    // Layout: one line, kerned advances.
    std::vector<PlacedGlyph> glyphs;
    const bool use_kerning = FT_HAS_KERNING(face_);
    FT_UInt previous = 0;
    FT_Pos pen_x = 0;
    for (uint32_t cp : decode_utf8(prepared)) {
        FT_UInt index = FT_Get_Char_Index(face_, cp);
        if (use_kerning && previous && index) {
            FT_Vector delta;
            if (FT_Get_Kerning(face_, previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                pen_x += delta.x;
            }
        }
        if (FT_Load_Glyph(face_, index, FT_LOAD_DEFAULT)) {
            CB_LOG("warn", "glyph load failed for U+" << std::hex << cp << std::dec);
            continue;
        }
        FT_Glyph glyph = nullptr;
        if (FT_Get_Glyph(face_->glyph, &glyph)) {
            continue;
        }
        glyphs.emplace_back(glyph, pen_x);
        pen_x += face_->glyph->advance.x;
        previous = index;
    }

    // Anchor: horizontal centre of the advance width, vertical middle of ascender/descender.
    const FT_Size_Metrics &metrics = face_->size->metrics;
    const double center_x = image.width / 2.0;
    const double center_y = image.height / 2.0;
    const double line_start = center_x - (pen_x / 64.0) / 2.0;
    const int baseline =
        static_cast<int>(std::lround(center_y + (metrics.ascender + metrics.descender) / 128.0));

    bool ok = true;
    if (stroker_ && options.stroke_width > 0) {
        FT_Stroker_Set(stroker_, static_cast<FT_Fixed>(options.stroke_width) * 64,
                       FT_STROKER_LINECAP_ROUND, FT_STROKER_LINEJOIN_ROUND, 0);
        for (const auto &g : glyphs) {
            int x = static_cast<int>(std::lround(line_start + g.pen_x / 64.0));
            ok &= draw_glyph(image, g.glyph, stroker_, x, baseline, options.stroke_fill);
        }
    }
    for (const auto &g : glyphs) {
        int x = static_cast<int>(std::lround(line_start + g.pen_x / 64.0));
        ok &= draw_glyph(image, g.glyph, nullptr, x, baseline, options.font_fill);
    }
    if (!ok) {
        CB_LOG("error", "glyph rendering failed for \"" << captionburn::text_preview(prepared)
                                                        << "\"");
    }
    return ok;
}
