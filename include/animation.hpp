//
//  animation.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

enum class AnimationKind { Pop, None };

inline constexpr double kPopDuration = 0.2;     // seconds until the pop settles at 1.0
inline constexpr double kPopStartScale = 0.6;   // scale on the first frame of a subtitle

// Pop-in: ease-out-back from kPopStartScale, brief overshoot, then exactly 1.0.
// Defined for every t; negative t is treated as 0.
double pop_scale(double t);

// Scale multiplier for `kind` at `t` seconds after the subtitle started.
double animation_scale(AnimationKind kind, double t);

std::optional<AnimationKind> parse_animation_kind(const std::string &name);
const char *animation_kind_name(AnimationKind kind);
