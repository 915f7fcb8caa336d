//
//  captionburn.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "encoder_command.hpp"
#include "media_probe.hpp"
#include "raw_transcript.hpp"
#include "subtitle_entry.hpp"
#include "subtitle_options.hpp"
#include "transcriber.hpp"

class FrameSink;
class TextRenderer;

namespace captionburn {

/// @defgroup api CaptionBurn Public API
/// Public, supported C++ interfaces for burning captions into videos.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., unreadable subtitles, probe or transcription failure, encoder exit).
 */
struct BurnStatus {
    bool ok{false};
    std::string message;
};

/**
 * @brief Everything a burn needs to know about its source, resolved once.
 *
 * `subtitles` is sorted by start; `probe` describes the first video stream.
 */
struct Session {
    std::string video_path;
    std::vector<SubtitleEntry> subtitles;
    MediaProbe probe;
};

/// Status plus the session on success.
struct SessionResult {
    BurnStatus status;
    std::optional<Session> session;
};

/// External tools used while opening a session.
struct SessionSettings {
    std::string ffprobe_binary = "ffprobe";
    TranscriberSettings transcriber;
};

/**
 * @brief Return the CaptionBurn library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Open a session with subtitles from an `.srt` or `.json` file.
SessionResult open_session(const std::string &video_path, const std::string &subtitle_path,
                           const SessionSettings &settings = {});  ///< @ingroup api

/// Open a session from an already-parsed transcript.
SessionResult open_session(const std::string &video_path, const RawTranscript &transcript,
                           const SessionSettings &settings = {});  ///< @ingroup api

/// Open a session by transcribing the video's speech with `model`.
SessionResult open_session(const std::string &video_path, WhisperModel model = WhisperModel::Base,
                           const SessionSettings &settings = {});  ///< @ingroup api

/**
 * @brief Render every frame of `session` into `sink`.
 *
 * Frame n shows the subtitle with the latest start frame `round(start * fps) <= n`, scaled by
 * the animation curve at `(n - start_frame) / fps`; frames before the first subtitle are the
 * all-zero blank frame. Stops at the first rejected write.
 *
 * @param frames_written Optional out-param receiving the number of frames accepted.
 */
BurnStatus render_frames(const Session &session, const SubtitleOptions &options,
                         TextRenderer &renderer, FrameSink &sink,
                         uint64_t *frames_written = nullptr);  ///< @ingroup api

/**
 * @brief Burn the session's subtitles into `output_path`.
 *
 * Spawns the encoder, streams every frame into it and always closes its input and waits for
 * it, whether the loop completed or failed.
 */
BurnStatus burn(const Session &session, const std::string &output_path,
                const SubtitleOptions &options = {},
                const EncoderSettings &settings = {});  ///< @ingroup api

/// @}

}  // namespace captionburn
