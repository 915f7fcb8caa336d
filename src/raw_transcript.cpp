//
//  raw_transcript.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "raw_transcript.hpp"

#include <nlohmann/json.hpp>

#include "logging.hpp"

using json = nlohmann::json;

namespace {

std::optional<double> time_field(const json &obj, const char *key) {
    if (!obj.contains(key) || !obj[key].is_number()) {
        return std::nullopt;
    }
    return obj[key].get<double>();
}

std::optional<RawTranscript> parse_transcript_object(const json &j) {
    if (!j.contains("segments") || !j["segments"].is_array()) {
        CB_LOG("error", "transcript: missing 'segments' array");
        return std::nullopt;
    }
    RawTranscript raw;
    raw.text = j.value("text", "");
    raw.language = j.value("language", "");
    raw.segments.reserve(j["segments"].size());
    size_t index = 0;
    for (const auto &s : j["segments"]) {
        auto start = s.is_object() ? time_field(s, "start") : std::nullopt;
        if (!start) {
            CB_LOG("error", "transcript: segment " << index << " has no numeric 'start'");
            return std::nullopt;
        }
        TranscriptSegment seg;
        seg.start = *start;
        seg.end = time_field(s, "end").value_or(*start);
        seg.text = s.value("text", "");
        if (s.contains("words") && s["words"].is_array()) {
            for (const auto &w : s["words"]) {
                auto wstart = w.is_object() ? time_field(w, "start") : std::nullopt;
                if (!wstart) {
                    CB_LOG("warn", "transcript: dropping untimed word in segment " << index);
                    continue;
                }
                TranscriptWord word;
                word.word = w.value("word", "");
                word.start = *wstart;
                word.end = time_field(w, "end").value_or(*wstart);
                seg.words.push_back(std::move(word));
            }
        }
        raw.segments.push_back(std::move(seg));
        ++index;
    }
    CB_LOG("debug", "transcript: " << raw.segments.size() << " segments, language="
                                   << (raw.language.empty() ? "?" : raw.language));
    return raw;
}

}  // namespace

std::optional<RawTranscript> parse_raw_transcript(const std::string &json_text) {
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        CB_LOG("error", "transcript: malformed JSON");
        return std::nullopt;
    }
    try {
        return parse_transcript_object(j);
    } catch (const json::exception &e) {
        // value() throws when a text field has the wrong type.
        CB_LOG("error", "transcript: " << e.what());
        return std::nullopt;
    }
}
