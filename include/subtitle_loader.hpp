//
//  subtitle_loader.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "raw_transcript.hpp"
#include "subtitle_entry.hpp"

// Load `.srt` or `.json` subtitles (flat entry array or whisper transcript), sorted by start.
std::optional<std::vector<SubtitleEntry>> load_subtitles_from_file(const std::string &path);

// One entry per timed word where a segment has words, otherwise one per segment. Empty texts
// are dropped; the result is sorted by start.
std::vector<SubtitleEntry> load_subtitles_from_raw_transcript(const RawTranscript &raw);

// Parse JSON subtitle content: `[{"text": ..., "start": ...}, ...]` or a whisper object.
std::optional<std::vector<SubtitleEntry>> parse_subtitle_json(const std::string &json_text);

// Entries as a JSON array with derived end times (the last one ends at total_seconds).
std::string subtitles_to_json(const std::vector<SubtitleEntry> &entries, double total_seconds);
