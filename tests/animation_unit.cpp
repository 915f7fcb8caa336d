// Validates the pop-in curve: minimum at t=0, overshoot, settle at 1.0, total for any t.
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "animation.hpp"
#include "text_renderer.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[animation_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_pop_start_is_minimum() {
    const double start = pop_scale(0.0);
    bool ok = check(std::fabs(start - kPopStartScale) < 1e-9, "pop(0) == start scale");
    for (int i = 1; i <= 1000; ++i) {
        double t = kPopDuration * 2.0 * i / 1000.0;
        ok &= check(pop_scale(t) >= start - 1e-12, "pop(t) never drops below pop(0)");
    }
    ok &= check(start > 0.0, "first frame still renders text");
    return ok;
}

bool test_pop_overshoots_then_settles() {
    double peak = 0.0;
    for (int i = 0; i <= 200; ++i) {
        peak = std::max(peak, pop_scale(kPopDuration * i / 200.0));
    }
    bool ok = check(peak > 1.0, "curve overshoots above 1.0");
    ok &= check(peak < 1.2, "overshoot stays brief");
    ok &= check(pop_scale(kPopDuration) == 1.0, "settled at the end of the pop");
    ok &= check(pop_scale(5.0) == 1.0, "settled afterwards");
    return ok;
}

bool test_pop_total() {
    bool ok = check(pop_scale(1e12) == 1.0, "defined for huge t");
    ok &= check(pop_scale(std::numeric_limits<double>::max()) == 1.0, "defined for max double");
    ok &= check(pop_scale(std::numeric_limits<double>::infinity()) == 1.0, "defined for +inf");
    ok &= check(pop_scale(-1.0) == kPopStartScale, "negative t clamps to start");
    ok &= check(pop_scale(std::nan("")) == kPopStartScale, "NaN treated as t=0");
    return ok;
}

bool test_kinds_and_names() {
    bool ok = check(animation_scale(AnimationKind::None, 0.0) == 1.0, "none is constant 1");
    ok &= check(animation_scale(AnimationKind::Pop, 0.0) == pop_scale(0.0), "pop dispatch");
    ok &= check(parse_animation_kind("pop") == AnimationKind::Pop, "parse pop");
    ok &= check(parse_animation_kind("none") == AnimationKind::None, "parse none");
    ok &= check(!parse_animation_kind("wiggle"), "reject unknown");
    ok &= check(std::string(animation_kind_name(AnimationKind::Pop)) == "pop", "name pop");
    return ok;
}

bool test_scaled_font_size() {
    bool ok = check(TextRenderer::scaled_font_size(100, 1.0) == 100, "scale 1");
    ok &= check(TextRenderer::scaled_font_size(100, kPopStartScale) == 60, "scale at t=0");
    ok &= check(TextRenderer::scaled_font_size(95, 0.5) == 47, "truncates");
    ok &= check(TextRenderer::scaled_font_size(100, 0.0) == 0, "zero scale");
    ok &= check(TextRenderer::scaled_font_size(100, -1.0) == 0, "never negative");
    // Overshoot past INT_MAX saturates instead of wrapping.
    ok &= check(TextRenderer::scaled_font_size(2000000000, 1.1) ==
                    std::numeric_limits<int>::max(),
                "saturates at INT_MAX");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_pop_start_is_minimum();
    ok &= test_pop_overshoots_then_settles();
    ok &= test_pop_total();
    ok &= test_kinds_and_names();
    ok &= test_scaled_font_size();
    if (!ok) {
        return 1;
    }
    std::cout << "animation_unit OK\n";
    return 0;
}
