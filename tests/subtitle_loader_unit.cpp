// Validates subtitle loading from SRT, flat JSON and whisper JSON, plus determinism and
// error reporting for malformed input.
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "srt_parser.hpp"
#include "subtitle_loader.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

namespace {

const std::string kData = TESTDATA_DIR;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[subtitle_loader_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool same_entry(const SubtitleEntry &e, const std::string &text, double start) {
    return e.text == text && e.start > start - 1e-9 && e.start < start + 1e-9;
}

bool test_srt_file() {
    auto subs = load_subtitles_from_file(kData + "/sample.srt");
    bool ok = check(subs.has_value(), "sample.srt loads");
    if (!subs) return false;
    ok &= check(subs->size() == 3, "three cues");
    if (subs->size() != 3) return false;
    ok &= check(same_entry((*subs)[0], "Hello there, world!", 0.0), "multi-line cue joined");
    ok &= check(same_entry((*subs)[1], "Out of order", 0.5), "sorted by start, hints ignored");
    ok &= check(same_entry((*subs)[2], "Second line", 1.5), "third cue");
    return ok;
}

bool test_srt_timestamps() {
    auto full = parse_srt_timestamp("01:02:03,456");
    bool ok = check(full && *full > 3723.4559 && *full < 3723.4561, "full timestamp");
    ok &= check(parse_srt_timestamp("00:00:01.5") == 1.5, "dot separator, short fraction");
    ok &= check(!parse_srt_timestamp("00:61:00,000"), "minutes out of range");
    ok &= check(!parse_srt_timestamp("garbage"), "garbage rejected");
    auto cues = parse_srt("1\n00:00:02,000 --> 00:00:01,000\nBackwards\n");
    ok &= check(!cues, "cue ending before start rejected");
    return ok;
}

bool test_json_entries() {
    auto subs = load_subtitles_from_file(kData + "/entries.json");
    bool ok = check(subs.has_value(), "entries.json loads");
    if (!subs) return false;
    ok &= check(subs->size() == 3, "blank entry dropped");
    if (subs->size() != 3) return false;
    ok &= check(same_entry((*subs)[0], "HELLO", 0.0), "text trimmed");
    ok &= check(same_entry((*subs)[1], "AGAIN", 0.5), "sorted");
    ok &= check(same_entry((*subs)[2], "WORLD", 1.0), "last");
    return ok;
}

bool test_whisper_file() {
    auto subs = load_subtitles_from_file(kData + "/whisper.json");
    bool ok = check(subs.has_value(), "whisper.json loads");
    if (!subs) return false;
    ok &= check(subs->size() == 3, "two words + one word-less segment");
    if (subs->size() != 3) return false;
    ok &= check(same_entry((*subs)[0], "Hello", 0.0), "first word");
    ok &= check(same_entry((*subs)[1], "world.", 0.6), "second word");
    ok &= check(same_entry((*subs)[2], "This is a test.", 1.4), "segment fallback");
    return ok;
}

bool test_raw_transcript() {
    RawTranscript raw;
    TranscriptSegment seg;
    seg.start = 2.0;
    seg.text = " Later segment ";
    raw.segments.push_back(seg);
    TranscriptSegment words_seg;
    words_seg.start = 0.0;
    words_seg.text = "ignored when words exist";
    words_seg.words = {{" One", 0.0, 0.4}, {"  ", 0.4, 0.5}, {" Two", 0.5, 0.9}};
    raw.segments.push_back(words_seg);

    auto subs = load_subtitles_from_raw_transcript(raw);
    bool ok = check(subs.size() == 3, "whitespace-only word dropped");
    if (subs.size() != 3) return false;
    ok &= check(same_entry(subs[0], "One", 0.0), "words first after sort");
    ok &= check(same_entry(subs[1], "Two", 0.5), "second word");
    ok &= check(same_entry(subs[2], "Later segment", 2.0), "segment entry");
    ok &= check(load_subtitles_from_raw_transcript(RawTranscript{}).empty(), "empty transcript");
    return ok;
}

bool test_deterministic_reload() {
    bool ok = true;
    for (const char *name : {"/sample.srt", "/entries.json", "/whisper.json"}) {
        auto a = load_subtitles_from_file(kData + name);
        auto b = load_subtitles_from_file(kData + name);
        ok &= check(a && b && *a == *b, std::string("reload identical for ") + name);
    }
    return ok;
}

bool test_extension_case_insensitive() {
    const auto dir = std::filesystem::path("test_outputs");
    std::filesystem::create_directories(dir);
    const auto upper = dir / "SAMPLE.SRT";
    std::error_code ec;
    std::filesystem::copy_file(kData + "/sample.srt", upper,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (!check(!ec, "copy fixture to SAMPLE.SRT")) {
        return false;
    }
    auto a = load_subtitles_from_file(upper.string());
    auto b = load_subtitles_from_file(kData + "/sample.srt");
    return check(a && b && *a == *b, "upper-case .SRT extension loads as SubRip");
}

bool test_failures() {
    captionburn::set_log_verbosity(captionburn::LogVerbosity::Error);
    bool ok = check(!load_subtitles_from_file(kData + "/missing.srt"), "missing file");
    ok &= check(!load_subtitles_from_file(kData + "/malformed.srt"), "malformed SRT");
    ok &= check(!load_subtitles_from_file(kData + "/style.json"), "JSON of the wrong shape");
    ok &= check(!load_subtitles_from_file(kData + "/probe.json"), "JSON without segments");
    ok &= check(!parse_subtitle_json("[{\"text\": \"x\"}]"), "entry without start");
    ok &= check(!parse_subtitle_json("{\"segments\": [{\"text\": \"x\"}]}"),
                "segment without start");
    ok &= check(!parse_subtitle_json("not json"), "malformed JSON");
    ok &= check(!parse_raw_transcript("{\"text\": \"no segments\"}"), "transcript w/o segments");
    ok &= check(!parse_raw_transcript("{\"segments\": [{\"start\": 0, \"text\": 5}]}"),
                "non-string segment text rejected");
    captionburn::set_log_verbosity(captionburn::LogVerbosity::Info);
    return ok;
}

bool test_dump_json() {
    std::vector<SubtitleEntry> subs = {{"A", 0.0}, {"B", 2.0}};
    auto dumped = subtitles_to_json(subs, 5.0);
    auto reparsed = parse_subtitle_json(dumped);
    bool ok = check(reparsed && *reparsed == subs, "dump parses back to the same entries");
    ok &= check(dumped.find("\"end\": 5.0") != std::string::npos, "last end is total duration");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_srt_file();
    ok &= test_srt_timestamps();
    ok &= test_json_entries();
    ok &= test_whisper_file();
    ok &= test_raw_transcript();
    ok &= test_deterministic_reload();
    ok &= test_extension_case_insensitive();
    ok &= test_failures();
    ok &= test_dump_json();
    if (!ok) {
        return 1;
    }
    std::cout << "subtitle_loader_unit OK\n";
    return 0;
}
