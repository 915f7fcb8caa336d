//
//  logging.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cerrno>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace captionburn {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/config level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Shortened subtitle text for debug logs, so per-frame lines stay on one row.
inline constexpr size_t kTextPreviewChars = 24;
inline std::string text_preview(const std::string &text, size_t max_len = kTextPreviewChars) {
    if (text.size() <= max_len) {
        return text;
    }
    // Do not cut a UTF-8 sequence in half.
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

// errno text for open/spawn/write failures.
inline std::string errno_message(int err) {
    return std::to_string(err) + " (" + std::generic_category().message(err) + ")";
}

}  // namespace captionburn

inline constexpr captionburn::LogVerbosity cb_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return captionburn::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return captionburn::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return captionburn::LogVerbosity::Info;
    }
    // Everything else (frame/probe/encoder/etc.) treated as debug-level.
    return captionburn::LogVerbosity::Debug;
}

inline bool cb_should_log(const char* level) {
    const auto current = captionburn::get_log_verbosity();
    const auto sev = cb_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cb_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CaptionBurn][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CaptionBurn][" << level << "] " << msg << std::endl;
    }
}

#define CB_LOG(level, message)                                              \
    do {                                                                    \
        if (cb_should_log(level)) {                                         \
            std::ostringstream _cb_log_ss;                                  \
            _cb_log_ss << message;                                          \
            cb_log_impl(level, _cb_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
