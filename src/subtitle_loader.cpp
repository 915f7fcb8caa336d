//
//  subtitle_loader.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_loader.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "logging.hpp"
#include "srt_parser.hpp"
#include "subtitle_timing.hpp"
#include "text_filter.hpp"

using json = nlohmann::json;
using captionburn::errno_message;

namespace {

bool read_text_file(const std::string &path, std::string &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        CB_LOG("error", "open failed for " << path << " errno=" << errno_message(errno));
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

void push_entry(std::vector<SubtitleEntry> &out, const std::string &text, double start) {
    std::string trimmed = trim_whitespace(text);
    if (trimmed.empty()) {
        return;
    }
    out.push_back(SubtitleEntry{std::move(trimmed), start});
}

std::optional<std::vector<SubtitleEntry>> parse_entry_array(const json &arr) {
    std::vector<SubtitleEntry> out;
    out.reserve(arr.size());
    size_t index = 0;
    for (const auto &e : arr) {
        if (!e.is_object() || !e.contains("start") || !e["start"].is_number() ||
            !e.contains("text") || !e["text"].is_string()) {
            CB_LOG("error", "subtitles: entry " << index << " needs string 'text' and numeric 'start'");
            return std::nullopt;
        }
        push_entry(out, e["text"].get<std::string>(), e["start"].get<double>());
        ++index;
    }
    normalize_subtitle_order(out);
    return out;
}

std::string lower_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

}  // namespace

std::vector<SubtitleEntry> load_subtitles_from_raw_transcript(const RawTranscript &raw) {
    std::vector<SubtitleEntry> out;
    for (const auto &seg : raw.segments) {
        if (seg.words.empty()) {
            push_entry(out, seg.text, seg.start);
            continue;
        }
        for (const auto &w : seg.words) {
            push_entry(out, w.word, w.start);
        }
    }
    normalize_subtitle_order(out);
    CB_LOG("debug", "subtitles: " << out.size() << " entries from " << raw.segments.size()
                                  << " transcript segments");
    return out;
}

std::optional<std::vector<SubtitleEntry>> parse_subtitle_json(const std::string &json_text) {
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        CB_LOG("error", "subtitles: malformed JSON");
        return std::nullopt;
    }
    if (j.is_array()) {
        return parse_entry_array(j);
    }
    if (j.is_object() && j.contains("segments")) {
        auto raw = parse_raw_transcript(json_text);
        if (!raw) {
            return std::nullopt;
        }
        return load_subtitles_from_raw_transcript(*raw);
    }
    CB_LOG("error", "subtitles: expected an entry array or a transcript object");
    return std::nullopt;
}

std::optional<std::vector<SubtitleEntry>> load_subtitles_from_file(const std::string &path) {
    std::string content;
    if (!read_text_file(path, content)) {
        return std::nullopt;
    }
    const auto ext = lower_extension(path);
    CB_LOG("debug", "subtitles: loading " << path << " (" << content.size() << " bytes)");
    if (ext == ".srt") {
        auto cues = parse_srt(content);
        if (!cues) {
            return std::nullopt;
        }
        std::vector<SubtitleEntry> out;
        out.reserve(cues->size());
        for (const auto &cue : *cues) {
            push_entry(out, cue.text, cue.start);
        }
        normalize_subtitle_order(out);
        return out;
    }
    if (ext == ".json") {
        return parse_subtitle_json(content);
    }
    CB_LOG("error", "subtitles: unsupported file type '" << ext << "' for " << path);
    return std::nullopt;
}

std::string subtitles_to_json(const std::vector<SubtitleEntry> &entries, double total_seconds) {
    const auto ends = derive_end_times_from_starts(entries, total_seconds);
    json arr = json::array();
    for (size_t i = 0; i < entries.size(); ++i) {
        json e;
        e["text"] = entries[i].text;
        e["start"] = entries[i].start;
        e["end"] = ends[i];
        arr.push_back(e);
    }
    return arr.dump(2);
}
