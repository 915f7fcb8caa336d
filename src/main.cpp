//
//  main.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "captionburn.hpp"
#include "logging.hpp"
#include "subtitle_loader.hpp"

namespace {

void print_usage() {
    std::cerr << "CaptionBurn " << captionburn::version_string() << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  captionburn <input.mp4> <output.mp4> [options]\n"
              << "Subtitle source (default: transcribe the input):\n"
              << "  --subtitles FILE      Load .srt or .json subtitles instead of transcribing.\n"
              << "  --model NAME          Speech model: tiny|base|small|medium|large (default: base).\n"
              << "  --language LANG       Spoken language hint for transcription.\n"
              << "Style (applied in order; later flags win):\n"
              << "  --style FILE          JSON style file with SubtitleOptions keys.\n"
              << "  --font PATH           TrueType/OpenType font file.\n"
              << "  --font-size N         Caption size in pixels at full scale.\n"
              << "  --fill COLOR          Text colour (#RRGGBB[AA] or name).\n"
              << "  --stroke-width N      Outline width in pixels (0 disables).\n"
              << "  --stroke-fill COLOR   Outline colour.\n"
              << "  --capitalize          Uppercase caption text.\n"
              << "  --filter-alnum        Strip punctuation and symbols.\n"
              << "  --offset SEC          Delay the overlay stream by SEC seconds.\n"
              << "  --animation KIND      pop|none (default: pop).\n"
              << "Other:\n"
              << "  --overwrite           Replace an existing output file.\n"
              << "  --dump-subtitles      Print resolved subtitles as JSON and exit (no output needed).\n"
              << "  --log-level LEVEL     error|warn|info|debug (default: info).\n"
              << "  --version             Print version and exit.\n";
}

std::optional<int> parse_int(const std::string &s) {
    char *end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v < 0 || v > kMaxPixelOption) {
        return std::nullopt;
    }
    return static_cast<int>(v);
}

std::optional<double> parse_double(const std::string &s) {
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CaptionBurn " << captionburn::version_string() << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    std::string subtitle_path;
    WhisperModel model = WhisperModel::Base;
    captionburn::SessionSettings session_settings;
    EncoderSettings encoder_settings;
    SubtitleOptions options;
    bool dump_subtitles = false;

    auto bad_value = [](const std::string &flag, const std::string &value) {
        std::cerr << "Invalid value for " << flag << ": " << value << "\n";
        return 2;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--overwrite") {
            encoder_settings.overwrite = true;
        } else if (arg == "--capitalize") {
            options.capitalize = true;
        } else if (arg == "--filter-alnum") {
            options.filter_alnum = true;
        } else if (arg == "--dump-subtitles") {
            dump_subtitles = true;
        } else if (arg == "--log-level" && has_value) {
            captionburn::set_log_verbosity(captionburn::parse_log_verbosity(argv[++i]));
        } else if (arg == "--subtitles" && has_value) {
            subtitle_path = argv[++i];
        } else if (arg == "--model" && has_value) {
            std::string v = argv[++i];
            auto m = parse_whisper_model(v);
            if (!m) return bad_value(arg, v);
            model = *m;
        } else if (arg == "--language" && has_value) {
            session_settings.transcriber.language = argv[++i];
        } else if (arg == "--style" && has_value) {
            std::string v = argv[++i];
            if (!load_style_file(v, options)) {
                CB_LOG("error", "captionburn: failed to load style " << v);
                return 1;
            }
        } else if (arg == "--font" && has_value) {
            options.font_path = argv[++i];
        } else if (arg == "--font-size" && has_value) {
            std::string v = argv[++i];
            auto n = parse_int(v);
            if (!n || *n == 0) return bad_value(arg, v);
            options.font_size = *n;
        } else if (arg == "--stroke-width" && has_value) {
            std::string v = argv[++i];
            auto n = parse_int(v);
            if (!n) return bad_value(arg, v);
            options.stroke_width = *n;
        } else if ((arg == "--fill" || arg == "--stroke-fill") && has_value) {
            std::string v = argv[++i];
            auto c = parse_color(v);
            if (!c) return bad_value(arg, v);
            (arg == "--fill" ? options.font_fill : options.stroke_fill) = *c;
        } else if (arg == "--offset" && has_value) {
            std::string v = argv[++i];
            auto d = parse_double(v);
            if (!d) return bad_value(arg, v);
            options.render_offset = *d;
        } else if (arg == "--animation" && has_value) {
            std::string v = argv[++i];
            auto kind = parse_animation_kind(v);
            if (!kind) return bad_value(arg, v);
            options.animation = *kind;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    // --dump-subtitles needs only the input; an output path given alongside it is ignored.
    const bool arity_ok = dump_subtitles ? (positional.size() == 1 || positional.size() == 2)
                                         : positional.size() == 2;
    if (!arity_ok) {
        print_usage();
        return 2;
    }
    const std::string input_path = positional[0];

    auto opened = subtitle_path.empty()
                      ? captionburn::open_session(input_path, model, session_settings)
                      : captionburn::open_session(input_path, subtitle_path, session_settings);
    if (!opened.status.ok) {
        CB_LOG("error", "captionburn: " << opened.status.message);
        return 1;
    }
    const captionburn::Session &session = *opened.session;

    if (dump_subtitles) {
        std::cout << subtitles_to_json(session.subtitles, session.probe.duration) << "\n";
        return 0;
    }

    const std::string output_path = positional[1];
    CB_LOG("debug", "style:\n" << style_to_json(options));
    auto status = captionburn::burn(session, output_path, options, encoder_settings);
    if (!status.ok) {
        CB_LOG("error", "captionburn: failed to burn captions: " << status.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
