//
//  text_filter.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_filter.hpp"

#include <cctype>

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string filter_alnum(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (is_ascii_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (c < 0x80 && !std::isalnum(c)) {
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::string to_upper_ascii(const std::string &text) {
    std::string out(text);
    for (auto &ch : out) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            ch = static_cast<char>(std::toupper(c));
        }
    }
    return out;
}

std::string trim_whitespace(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_ascii_space(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && is_ascii_space(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<uint32_t> decode_utf8(const std::string &text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            len = 1;
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }
        if (i + len > text.size()) {
            out.push_back(kReplacementChar);
            break;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}
