//
//  media_probe.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "media_probe.hpp"

#include <cmath>
#include <cstdlib>
#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "subprocess.hpp"

using json = nlohmann::json;

namespace {

// ffprobe reports most numbers as strings ("1234", "12.500000", "N/A").
std::optional<double> number_field(const json &obj, const char *key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return std::nullopt;
    }
    const json &v = obj[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        char *end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (!s.empty() && end && *end == '\0' && std::isfinite(d)) {
            return d;
        }
    }
    return std::nullopt;
}

std::optional<std::pair<uint32_t, uint32_t>> rate_field(const json &obj, const char *key) {
    if (!obj.contains(key) || !obj[key].is_string()) {
        return std::nullopt;
    }
    return parse_frame_rate(obj[key].get<std::string>());
}

}  // namespace

std::optional<std::pair<uint32_t, uint32_t>> parse_frame_rate(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto slash = text.find('/');
    const std::string num_s = text.substr(0, slash);
    const std::string den_s = slash == std::string::npos ? "1" : text.substr(slash + 1);
    char *end = nullptr;
    unsigned long num = std::strtoul(num_s.c_str(), &end, 10);
    if (num_s.empty() || *end != '\0') {
        return std::nullopt;
    }
    unsigned long den = std::strtoul(den_s.c_str(), &end, 10);
    if (den_s.empty() || *end != '\0') {
        return std::nullopt;
    }
    if (num == 0 || den == 0 || num > 0xFFFFFFFFul || den > 0xFFFFFFFFul) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<uint32_t>(num), static_cast<uint32_t>(den));
}

std::optional<MediaProbe> parse_probe_json(const std::string &json_text) {
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        CB_LOG("error", "probe: malformed ffprobe JSON");
        return std::nullopt;
    }
    if (!j.contains("streams") || !j["streams"].is_array() || j["streams"].empty()) {
        CB_LOG("error", "probe: no video stream found");
        return std::nullopt;
    }
    const json &stream = j["streams"][0];
    MediaProbe probe;
    auto width = number_field(stream, "width");
    auto height = number_field(stream, "height");
    if (!width || !height || *width <= 0 || *height <= 0) {
        CB_LOG("error", "probe: missing or zero frame dimensions");
        return std::nullopt;
    }
    probe.width = static_cast<uint32_t>(*width);
    probe.height = static_cast<uint32_t>(*height);

    // r_frame_rate is the container's base rate; avg_frame_rate is the fallback for streams
    // that report "0/0" there.
    auto rate = rate_field(stream, "r_frame_rate");
    if (!rate) {
        rate = rate_field(stream, "avg_frame_rate");
    }
    if (!rate) {
        CB_LOG("error", "probe: no usable frame rate");
        return std::nullopt;
    }
    probe.fps_num = rate->first;
    probe.fps_den = rate->second;
    probe.fps = static_cast<double>(probe.fps_num) / probe.fps_den;

    auto duration = number_field(stream, "duration");
    if (!duration && j.contains("format")) {
        duration = number_field(j["format"], "duration");
    }
    probe.duration = duration.value_or(0.0);

    auto nb_frames = number_field(stream, "nb_frames");
    if (nb_frames && *nb_frames > 0) {
        probe.frame_count = static_cast<uint64_t>(*nb_frames);
    } else if (probe.duration > 0.0) {
        probe.frame_count = static_cast<uint64_t>(std::llround(probe.duration * probe.fps));
    } else {
        CB_LOG("error", "probe: neither frame count nor duration available");
        return std::nullopt;
    }
    CB_LOG("debug", "probe: " << probe.width << "x" << probe.height << " @ " << probe.fps_num
                              << "/" << probe.fps_den << " fps, " << probe.frame_count
                              << " frames, " << probe.duration << "s");
    return probe;
}

std::optional<MediaProbe> probe_media(const std::string &path, const std::string &ffprobe_binary) {
    std::vector<std::string> argv = {ffprobe_binary,
                                     "-v",
                                     "error",
                                     "-select_streams",
                                     "v:0",
                                     "-show_entries",
                                     "stream=width,height,r_frame_rate,avg_frame_rate,nb_frames,duration",
                                     "-show_entries",
                                     "format=duration",
                                     "-of",
                                     "json",
                                     path};
    auto res = run_command(argv);
    if (!res.spawned) {
        CB_LOG("error", "probe: could not run " << ffprobe_binary);
        return std::nullopt;
    }
    if (res.exit_code != 0) {
        CB_LOG("error", "probe: " << ffprobe_binary << " exited with " << res.exit_code
                                  << " for " << path);
        return std::nullopt;
    }
    return parse_probe_json(res.output);
}
