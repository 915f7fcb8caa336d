//
//  animation.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "animation.hpp"

namespace {

// Overshoot constants of the standard ease-out-back curve (about 10% overshoot).
constexpr double kBackC1 = 1.70158;
constexpr double kBackC3 = kBackC1 + 1.0;

double ease_out_back(double p) {
    double f = p - 1.0;
    return 1.0 + kBackC3 * f * f * f + kBackC1 * f * f;
}

}  // namespace

double pop_scale(double t) {
    if (!(t > 0.0)) {
        // Also catches NaN.
        return kPopStartScale;
    }
    if (t >= kPopDuration) {
        return 1.0;
    }
    double p = t / kPopDuration;
    return kPopStartScale + (1.0 - kPopStartScale) * ease_out_back(p);
}

double animation_scale(AnimationKind kind, double t) {
    switch (kind) {
        case AnimationKind::Pop:
            return pop_scale(t);
        case AnimationKind::None:
            break;
    }
    return 1.0;
}

std::optional<AnimationKind> parse_animation_kind(const std::string &name) {
    if (name == "pop") return AnimationKind::Pop;
    if (name == "none") return AnimationKind::None;
    return std::nullopt;
}

const char *animation_kind_name(AnimationKind kind) {
    return kind == AnimationKind::Pop ? "pop" : "none";
}
