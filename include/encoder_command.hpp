//
//  encoder_command.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Raw overlay geometry used when the caller does not supply the probed size (vertical 1080p).
inline constexpr uint32_t kDefaultOverlayWidth = 1080;
inline constexpr uint32_t kDefaultOverlayHeight = 1920;

/// @ingroup api
/// How the encoder is invoked; independent of the individual video.
struct EncoderSettings {
    std::string ffmpeg_binary = "ffmpeg";
    std::string video_codec = "libx264";
    std::string log_level = "error";
    bool overwrite = false;  ///< pass -y; without it an existing output fails the burn early
};

// Per-burn inputs of the encoder command.
struct EncoderRequest {
    std::string input_path;
    std::string output_path;
    uint32_t fps_num = 30;
    uint32_t fps_den = 1;
    uint32_t width = kDefaultOverlayWidth;
    uint32_t height = kDefaultOverlayHeight;
    double render_offset = 0.0;  ///< seconds added to the overlay stream's timestamps
};

// Filter graph shifting the piped overlay by `render_offset` and laying it over the source.
std::string build_overlay_filter(double render_offset);

// Full argv: source video + raw RGBA frames on stdin in, overlay composited, source audio
// copied untouched.
std::vector<std::string> build_encoder_command(const EncoderRequest &request,
                                               const EncoderSettings &settings);
