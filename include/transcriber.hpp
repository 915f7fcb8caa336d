//
//  transcriber.hpp
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

/// @ingroup api
/// Speech model size handed to the recognizer.
enum class WhisperModel { Tiny, Base, Small, Medium, Large };

std::optional<WhisperModel> parse_whisper_model(const std::string &name);
const char *whisper_model_name(WhisperModel model);

struct TranscriberSettings {
    std::string whisper_binary = "whisper";
    std::string language;  // empty lets the recognizer detect it
};

// Argument vector for one recognizer run writing `<output_dir>/<stem>.json`.
std::vector<std::string> build_whisper_command(const std::string &video_path, WhisperModel model,
                                               const std::string &output_dir,
                                               const TranscriberSettings &settings);

// Run the recognizer on `video_path` with word timestamps and parse its JSON result.
std::optional<RawTranscript> transcribe(const std::string &video_path, WhisperModel model,
                                        const TranscriberSettings &settings = {});
