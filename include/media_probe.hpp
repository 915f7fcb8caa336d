//
//  media_probe.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

/// @ingroup api
/// Video stream facts, read once per session.
struct MediaProbe {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t fps_num = 0;
    uint32_t fps_den = 1;
    double fps = 0.0;
    uint64_t frame_count = 0;
    double duration = 0.0;  // seconds; 0 when unknown
};

// Run ffprobe on the first video stream of `path`.
std::optional<MediaProbe> probe_media(const std::string &path,
                                      const std::string &ffprobe_binary = "ffprobe");

// Parse `ffprobe -of json` output (streams[0] + format). Exposed for tests.
std::optional<MediaProbe> parse_probe_json(const std::string &json_text);

// Parse an ffprobe rational such as "30000/1001" or "25".
std::optional<std::pair<uint32_t, uint32_t>> parse_frame_rate(const std::string &text);
