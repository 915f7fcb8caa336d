//
//  srt_parser.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_parser.hpp"

#include <cmath>
#include <sstream>

#include "logging.hpp"
#include "text_filter.hpp"

namespace {

constexpr std::string_view kArrow = "-->";

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::optional<unsigned> parse_uint(std::string_view s) {
    if (!all_digits(s)) {
        return std::nullopt;
    }
    unsigned v = 0;
    for (char c : s) {
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    return v;
}

}  // namespace

std::optional<double> parse_srt_timestamp(std::string_view timestamp) {
    std::string t = trim_whitespace(std::string(timestamp));
    // HH:MM:SS,mmm
    auto c1 = t.find(':');
    auto c2 = c1 == std::string::npos ? std::string::npos : t.find(':', c1 + 1);
    auto sep = c2 == std::string::npos ? std::string::npos : t.find_first_of(",.", c2 + 1);
    if (c1 == std::string::npos || c2 == std::string::npos || sep == std::string::npos) {
        return std::nullopt;
    }
    std::string_view view(t);
    auto h = parse_uint(view.substr(0, c1));
    auto m = parse_uint(view.substr(c1 + 1, c2 - c1 - 1));
    auto s = parse_uint(view.substr(c2 + 1, sep - c2 - 1));
    auto frac = view.substr(sep + 1);
    auto ms = parse_uint(frac);
    if (!h || !m || !s || !ms || *m >= 60 || *s >= 60 || frac.size() > 3) {
        return std::nullopt;
    }
    double millis = *ms * std::pow(10.0, 3 - static_cast<int>(frac.size()));
    return *h * 3600.0 + *m * 60.0 + *s + millis / 1000.0;
}

std::optional<std::vector<SrtCue>> parse_srt(const std::string &content) {
    std::string body = content;
    if (body.size() >= 3 && static_cast<unsigned char>(body[0]) == 0xEF &&
        static_cast<unsigned char>(body[1]) == 0xBB && static_cast<unsigned char>(body[2]) == 0xBF) {
        body.erase(0, 3);
    }
    std::istringstream in(body);
    std::vector<SrtCue> cues;
    std::string line;
    size_t line_no = 0;
    std::optional<SrtCue> current;
    auto flush = [&]() {
        if (current) {
            current->text = trim_whitespace(current->text);
            cues.push_back(std::move(*current));
            current.reset();
        }
    };
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = trim_whitespace(line);
        if (trimmed.empty()) {
            flush();
            continue;
        }
        auto arrow = trimmed.find(kArrow);
        if (arrow != std::string::npos && (!current || current->text.empty())) {
            // Timing line; anything after the end stamp (position hints) is ignored.
            std::string end_part = trimmed.substr(arrow + kArrow.size());
            end_part = trim_whitespace(end_part);
            auto space = end_part.find_first_of(" \t");
            if (space != std::string::npos) {
                end_part = end_part.substr(0, space);
            }
            auto start = parse_srt_timestamp(trimmed.substr(0, arrow));
            auto end = parse_srt_timestamp(end_part);
            if (!start || !end) {
                CB_LOG("error", "srt: malformed timing at line " << line_no << ": " << trimmed);
                return std::nullopt;
            }
            if (*end < *start) {
                CB_LOG("error", "srt: cue ends before it starts at line " << line_no);
                return std::nullopt;
            }
            current = SrtCue{*start, *end, {}};
            continue;
        }
        if (!current) {
            // Cue counter (or stray text before the first timing line).
            if (!all_digits(trimmed)) {
                CB_LOG("warn", "srt: ignoring text outside a cue at line " << line_no);
            }
            continue;
        }
        if (!current->text.empty()) {
            current->text.push_back(' ');
        }
        current->text += trimmed;
    }
    flush();
    return cues;
}
