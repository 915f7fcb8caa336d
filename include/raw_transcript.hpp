//
//  raw_transcript.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

/// @ingroup api
/// Speech-recognition result in the shape the whisper CLI writes with `--output_format json`.
struct TranscriptWord {
    std::string word;
    double start = 0.0;
    double end = 0.0;
};

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::vector<TranscriptWord> words;  ///< empty unless word timestamps were requested
};

struct RawTranscript {
    std::string text;
    std::string language;
    std::vector<TranscriptSegment> segments;
};

// Parse a whisper JSON document. Segments without a numeric start are rejected.
std::optional<RawTranscript> parse_raw_transcript(const std::string &json_text);
