//
//  encoder_command.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "encoder_command.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

std::string build_overlay_filter(double render_offset) {
    std::ostringstream oss;
    // Enough digits that the offset ffmpeg parses is the configured double.
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "[1:v]setpts=PTS+" << render_offset << "/TB[v1];[0:v][v1]overlay=0:0";
    return oss.str();
}

std::vector<std::string> build_encoder_command(const EncoderRequest &request,
                                               const EncoderSettings &settings) {
    std::vector<std::string> argv;
    argv.push_back(settings.ffmpeg_binary);
    if (settings.overwrite) {
        argv.push_back("-y");
    }
    // Input 0: the source video (video + audio).
    argv.insert(argv.end(), {"-i", request.input_path});
    // Input 1: overlay frames from stdin.
    const std::string size = std::to_string(request.width) + "x" + std::to_string(request.height);
    const std::string rate = request.fps_den == 1
                                 ? std::to_string(request.fps_num)
                                 : std::to_string(request.fps_num) + "/" +
                                       std::to_string(request.fps_den);
    argv.insert(argv.end(), {"-f", "rawvideo", "-pix_fmt", "rgba", "-s", size, "-framerate", rate,
                             "-i", "-"});
    argv.insert(argv.end(), {"-filter_complex", build_overlay_filter(request.render_offset)});
    // '?' keeps sources without an audio track working.
    argv.insert(argv.end(), {"-map", "0:a?", "-c:v", settings.video_codec, "-c:a", "copy"});
    argv.insert(argv.end(), {"-loglevel", settings.log_level, request.output_path});
    return argv;
}
