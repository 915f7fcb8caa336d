//
//  subtitle_options.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_options.hpp"

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "logging.hpp"

using json = nlohmann::json;

namespace {

bool read_color(const json &j, const char *key, RgbaColor &out) {
    if (!j[key].is_string()) {
        CB_LOG("error", "style: '" << key << "' must be a colour string");
        return false;
    }
    auto c = parse_color(j[key].get<std::string>());
    if (!c) {
        CB_LOG("error", "style: unparsable colour for '" << key << "': " << j[key].dump());
        return false;
    }
    out = *c;
    return true;
}

bool type_error(const std::string &key, const json &v) {
    CB_LOG("error", "style: wrong type for '" << key << "': " << v.dump());
    return false;
}

bool apply_style(const json &j, SubtitleOptions &options) {
    if (!j.is_object()) {
        CB_LOG("error", "style: top-level value must be an object");
        return false;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string &key = it.key();
        const json &v = it.value();
        if (key == "font_path") {
            if (!v.is_string()) return type_error(key, v);
            options.font_path = v.get<std::string>();
        } else if (key == "font_size") {
            if (!v.is_number_integer() || v.get<int64_t>() <= 0 ||
                v.get<int64_t>() > kMaxPixelOption) {
                return type_error(key, v);
            }
            options.font_size = v.get<int>();
        } else if (key == "font_fill") {
            if (!read_color(j, "font_fill", options.font_fill)) return false;
        } else if (key == "capitalize") {
            if (!v.is_boolean()) return type_error(key, v);
            options.capitalize = v.get<bool>();
        } else if (key == "filter_alnum") {
            if (!v.is_boolean()) return type_error(key, v);
            options.filter_alnum = v.get<bool>();
        } else if (key == "stroke_width") {
            if (!v.is_number_integer() || v.get<int64_t>() < 0 ||
                v.get<int64_t>() > kMaxPixelOption) {
                return type_error(key, v);
            }
            options.stroke_width = v.get<int>();
        } else if (key == "stroke_fill") {
            if (!read_color(j, "stroke_fill", options.stroke_fill)) return false;
        } else if (key == "render_offset") {
            if (!v.is_number()) return type_error(key, v);
            options.render_offset = v.get<double>();
        } else if (key == "animation") {
            auto kind = v.is_string() ? parse_animation_kind(v.get<std::string>()) : std::nullopt;
            if (!kind) return type_error(key, v);
            options.animation = *kind;
        } else {
            CB_LOG("warn", "style: ignoring unknown key '" << key << "'");
        }
    }
    return true;
}

}  // namespace

bool parse_style_json(const std::string &json_text, SubtitleOptions &options) {
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        CB_LOG("error", "style: malformed JSON");
        return false;
    }
    return apply_style(j, options);
}

bool load_style_file(const std::string &path, SubtitleOptions &options) {
    std::ifstream f(path);
    if (!f.is_open()) {
        CB_LOG("error", "open failed for " << path << " errno=" << captionburn::errno_message(errno));
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    CB_LOG("debug", "style: loading " << path);
    return parse_style_json(ss.str(), options);
}

std::string style_to_json(const SubtitleOptions &options) {
    json j;
    j["font_path"] = options.font_path;
    j["font_size"] = options.font_size;
    j["font_fill"] = format_color(options.font_fill);
    j["capitalize"] = options.capitalize;
    j["filter_alnum"] = options.filter_alnum;
    j["stroke_width"] = options.stroke_width;
    j["stroke_fill"] = format_color(options.stroke_fill);
    j["render_offset"] = options.render_offset;
    j["animation"] = animation_kind_name(options.animation);
    return j.dump(2);
}
