//
//  srt_parser.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct SrtCue {
    double start = 0.0;  // seconds
    double end = 0.0;    // seconds
    std::string text;    // cue lines joined with a single space
};

// Parse "HH:MM:SS,mmm" (a '.' separator is accepted too) into seconds.
std::optional<double> parse_srt_timestamp(std::string_view timestamp);

// Parse SubRip content. Tolerates a UTF-8 BOM, CRLF line endings and missing cue numbers.
// Returns nullopt on a malformed timing line or a cue ending before it starts.
std::optional<std::vector<SrtCue>> parse_srt(const std::string &content);
