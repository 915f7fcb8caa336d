//
//  subtitle_entry.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

/// @ingroup api
/// One caption: shown from `start` until the next entry starts.
struct SubtitleEntry {
    std::string text;    ///< UTF-8 text
    double start = 0.0;  ///< Absolute start time in seconds

    bool operator==(const SubtitleEntry &other) const {
        return text == other.text && start == other.start;
    }
};
