//
//  subtitle_timing.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

#include "logging.hpp"

// Frame index at which a subtitle starting at `start_seconds` becomes visible. Halfway cases
// round to the even frame (default FE_TONEAREST mode).
inline int64_t start_frame_for(double start_seconds, double fps) {
    return static_cast<int64_t>(std::nearbyint(start_seconds * fps));
}

// Index of the sample with the latest start time among those whose start frame is <= `frame`,
// if any. A sample stays active until the next one starts. Samples sharing a start frame are
// ordered by start time; only an exact start-time tie falls back to the first sample.
template <typename Sample>
inline std::optional<size_t> select_active_subtitle(const std::vector<Sample> &samples,
                                                    int64_t frame, double fps) {
    std::optional<size_t> best;
    double best_start = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (frame < start_frame_for(samples[i].start, fps)) {
            continue;
        }
        if (!best || samples[i].start > best_start) {
            best = i;
            best_start = samples[i].start;
        }
    }
    return best;
}

// Derive end times (seconds) from sorted start times: each sample ends where the next one
// starts. The last one ends at total_seconds when that lies after its start, otherwise it gets
// kMinDisplaySeconds.
inline constexpr double kMinDisplaySeconds = 0.001;

template <typename Sample>
inline std::vector<double> derive_end_times_from_starts(const std::vector<Sample> &samples,
                                                        double total_seconds = 0.0) {
    std::vector<double> ends;
    ends.reserve(samples.size());
    if (samples.empty()) {
        return ends;
    }
    for (size_t i = 0; i < samples.size(); ++i) {
        double cur = samples[i].start;
        if (i + 1 < samples.size()) {
            double next = samples[i + 1].start;
            ends.push_back(next > cur ? next : cur + kMinDisplaySeconds);
        } else if (total_seconds > cur) {
            ends.push_back(total_seconds);
        } else {
            ends.push_back(cur + kMinDisplaySeconds);
        }
    }
    return ends;
}

// Stable-sort by start and warn about entries that begin before zero.
template <typename Sample>
inline void normalize_subtitle_order(std::vector<Sample> &samples) {
    std::stable_sort(samples.begin(), samples.end(),
                     [](const Sample &a, const Sample &b) { return a.start < b.start; });
    if (!samples.empty() && samples.front().start < 0.0) {
        CB_LOG("warn", "first subtitle starts at " << samples.front().start
                                                   << "s; it will show from frame 0");
    }
}
