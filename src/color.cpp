//
//  color.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "color.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace {

struct NamedColor {
    const char *name;
    RgbaColor color;
};

constexpr NamedColor kNamedColors[] = {
    {"white", {255, 255, 255, 255}},  {"black", {0, 0, 0, 255}},
    {"red", {255, 0, 0, 255}},        {"green", {0, 128, 0, 255}},
    {"blue", {0, 0, 255, 255}},       {"yellow", {255, 255, 0, 255}},
    {"transparent", {0, 0, 0, 0}},
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<uint8_t> hex_byte(const std::string &s, size_t pos) {
    int hi = hex_value(s[pos]);
    int lo = hex_value(s[pos + 1]);
    if (hi < 0 || lo < 0) {
        return std::nullopt;
    }
    return static_cast<uint8_t>((hi << 4) | lo);
}

}  // namespace

std::optional<RgbaColor> parse_color(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text[0] == '#') {
        if (text.size() != 7 && text.size() != 9) {
            return std::nullopt;
        }
        auto r = hex_byte(text, 1);
        auto g = hex_byte(text, 3);
        auto b = hex_byte(text, 5);
        if (!r || !g || !b) {
            return std::nullopt;
        }
        RgbaColor c{*r, *g, *b, 255};
        if (text.size() == 9) {
            auto a = hex_byte(text, 7);
            if (!a) {
                return std::nullopt;
            }
            c.a = *a;
        }
        return c;
    }
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    for (const auto &named : kNamedColors) {
        if (lower == named.name) {
            return named.color;
        }
    }
    return std::nullopt;
}

std::string format_color(const RgbaColor &color) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    return buf;
}
