//=============================================================================
// RingAnimator tests
//
// Arc growth and shrink, color blending, cycle bookkeeping, finishing mode.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <arcspin/ring-animator.h>

#include <cmath>
#include <limits>

using namespace boost::ut;
using namespace arcspin;

static bool near(float a, float b, float eps = 1e-4f) { return std::fabs(a - b) <= eps; }

static constexpr uint32_t RED = 0xFFFF0000u;
static constexpr uint32_t GREEN = 0xFF00FF00u;
static constexpr uint32_t BLUE = 0xFF0000FFu;

static RingAnimator startedAnimator(std::vector<uint32_t> palette = {RED, BLUE}) {
    RingAnimator animator;
    (void)animator.ring().setColors(std::move(palette));
    animator.start();
    return animator;
}

suite ring_animator_contract_tests = [] {
    "ring rotation derives from arc limits"_test = [] {
        expect(near(RingAnimator::RING_ROTATION, 0.21f, 1e-6f));
        expect(RingAnimator::GROUP_FULL_ROTATION == 216.0_f);
    };

    "advance before any snapshot is an error"_test = [] {
        RingAnimator animator;
        expect(!animator.advance(0.2f).has_value());
    };

    "advance rejects t outside [0,1]"_test = [] {
        auto animator = startedAnimator();
        expect(!animator.advance(-0.01f).has_value());
        expect(!animator.advance(1.01f).has_value());
        expect(!animator.advance(std::numeric_limits<float>::quiet_NaN()).has_value());
        expect(animator.advance(0.0f).has_value());
        expect(animator.advance(1.0f).has_value());
    };
};

suite ring_animator_arc_tests = [] {
    "cycle starts with the minimum arc"_test = [] {
        auto animator = startedAnimator();
        auto f = animator.advance(0.0f);
        expect(f.has_value());
        expect(near(f->startTrim, 0.0f));
        expect(near(f->endTrim, RingAnimator::MIN_PROGRESS_ARC));
    };

    "minimum arc is measured from the snapshot start"_test = [] {
        auto animator = startedAnimator();
        expect(animator.onCycleComplete().has_value());
        const float base = animator.ring().originals().startTrim;
        expect(near(base, 0.78f, 1e-3f));

        auto f = animator.advance(0.0f);
        expect(f.has_value());
        expect(near(f->startTrim, base));
        expect(near(f->endTrim, base + RingAnimator::MIN_PROGRESS_ARC));
    };

    "arc never exceeds the maximum"_test = [] {
        auto animator = startedAnimator();
        bool bounded = true;
        for (int i = 0; i <= 1000; ++i) {
            auto f = animator.advance(static_cast<float>(i) / 1000.0f, true);
            if (!f || f->endTrim - f->startTrim > RingAnimator::MAX_PROGRESS_ARC + 1e-5f) {
                bounded = false;
            }
        }
        expect(bounded);
    };

    "growth follows the eased curve"_test = [] {
        auto animator = startedAnimator();
        auto f = animator.advance(0.25f);
        expect(f.has_value());
        // ease(0.5) = 0.77556
        expect(near(f->endTrim, 0.79f * 0.77556f + 0.01f, 2e-3f));
        expect(near(f->startTrim, 0.0f));
    };

    "shrink pins the leading edge"_test = [] {
        auto animator = startedAnimator();
        auto f = animator.advance(0.75f);
        expect(f.has_value());
        expect(near(f->endTrim, 0.79f));
        // ease(0.5) = 0.77556
        expect(near(f->startTrim, 0.79f - ((1.0f - 0.77556f) * 0.79f + 0.01f), 2e-3f));
    };

    "midpoint hand-off moves the leading edge by at most the minimum arc"_test = [] {
        auto animator = startedAnimator();
        auto before = animator.advance(0.4999f);
        expect(before.has_value());
        const float endBefore = before->endTrim;
        auto at = animator.advance(0.5f);
        expect(at.has_value());
        expect(std::fabs(endBefore - at->endTrim) <= RingAnimator::MIN_PROGRESS_ARC + 2e-3f);
        expect(near(at->endTrim, 0.79f));
    };

    "custom easing curve is used for growth"_test = [] {
        RingAnimator animator(std::make_shared<LinearInterpolator>());
        animator.start();
        auto f = animator.advance(0.25f);
        expect(f.has_value());
        expect(near(f->endTrim, 0.79f * 0.5f + 0.01f));
    };
};

suite ring_animator_rotation_tests = [] {
    "ring rotation advances one step per cycle"_test = [] {
        auto animator = startedAnimator();
        auto f = animator.advance(1.0f, true);
        expect(f.has_value());
        expect(near(f->rotation, RingAnimator::RING_ROTATION));

        expect(animator.onCycleComplete().has_value());
        f = animator.advance(0.5f);
        expect(f.has_value());
        expect(near(f->rotation, 1.5f * RingAnimator::RING_ROTATION));
    };

    "group rotation accumulates across cycles"_test = [] {
        auto animator = startedAnimator();
        auto f = animator.advance(0.5f);
        expect(f.has_value());
        expect(near(f->groupRotation, 108.0f, 1e-3f));

        expect(animator.onCycleComplete().has_value());
        expect(animator.repeatCount() == 1_i);
        f = animator.advance(0.5f);
        expect(f.has_value());
        expect(near(f->groupRotation, 324.0f, 1e-3f));
    };

    "boundary frame without last-frame flag is ignored"_test = [] {
        auto animator = startedAnimator();
        auto before = animator.advance(0.6f);
        expect(before.has_value());
        auto at = animator.advance(1.0f);
        expect(at.has_value());
        expect(at->startTrim == before->startTrim);
        expect(at->endTrim == before->endTrim);
        expect(at->rotation == before->rotation);
        expect(at->color == before->color);
        expect(at->groupRotation == before->groupRotation);
    };
};

suite ring_animator_color_tests = [] {
    "color holds until three quarters"_test = [] {
        auto animator = startedAnimator({RED, BLUE});
        bool held = true;
        for (int i = 0; i <= 750; ++i) {
            auto f = animator.advance(static_cast<float>(i) / 1000.0f);
            if (!f || f->color != RED) held = false;
        }
        expect(held);
    };

    "color approaches the next entry after three quarters"_test = [] {
        auto animator = startedAnimator({RED, BLUE});
        uint32_t prevRed = 255, prevBlue = 0;
        bool monotonic = true;
        for (int i = 751; i <= 1000; ++i) {
            auto f = animator.advance(static_cast<float>(i) / 1000.0f, true);
            if (!f) { monotonic = false; break; }
            uint32_t r = color::red(f->color);
            uint32_t b = color::blue(f->color);
            if (r > prevRed || b < prevBlue) monotonic = false;
            prevRed = r;
            prevBlue = b;
        }
        expect(monotonic);
        expect(animator.frame().color == BLUE);
    };

    "cycle completion walks the palette"_test = [] {
        auto animator = startedAnimator({RED, GREEN, BLUE});
        expect(animator.ring().colorIndex() == 0_i);
        expect(animator.onCycleComplete().has_value());
        expect(animator.ring().colorIndex() == 1_i);
        expect(animator.onCycleComplete().has_value());
        expect(animator.ring().colorIndex() == 2_i);
        expect(animator.onCycleComplete().has_value());
        expect(animator.ring().colorIndex() == 0_i);
        expect(animator.frame().color == RED);
    };

    "tick routes repeats to cycle completion"_test = [] {
        auto animator = startedAnimator({RED, GREEN});
        auto f = animator.tick(0.3f, false, false);
        expect(f.has_value());
        expect(animator.ring().colorIndex() == 0_i);
        f = animator.tick(1.0f, true, false);
        expect(f.has_value());
        expect(animator.ring().colorIndex() == 1_i);
    };
};

suite ring_animator_lifecycle_tests = [] {
    "start without an open arc spins from the first color"_test = [] {
        RingAnimator animator;
        expect(animator.ring().setColors({RED, GREEN, BLUE}).has_value());
        expect(animator.ring().setColorIndex(2).has_value());
        animator.start();
        expect(!animator.finishing());
        expect(animator.ring().colorIndex() == 0_i);
        expect(animator.durationMs() == 1332_i);
        expect(animator.ring().startTrim() == 0.0_f);
        expect(animator.ring().endTrim() == 0.0_f);
    };

    "start with an open arc enters finishing at half duration"_test = [] {
        RingAnimator animator;
        animator.ring().setStartTrim(0.1f);
        animator.ring().setEndTrim(0.5f);
        animator.start();
        expect(animator.finishing());
        expect(animator.durationMs() == 666_i);
    };

    "finishing closes the arc toward its end"_test = [] {
        RingAnimator animator;
        animator.ring().setStartTrim(0.1f);
        animator.ring().setEndTrim(0.5f);
        animator.ring().setRotation(0.9f);
        animator.start();

        auto f = animator.advance(0.5f);
        expect(f.has_value());
        expect(near(f->startTrim, 0.1f + (0.5f - 0.01f - 0.1f) * 0.5f));
        expect(near(f->endTrim, 0.5f));
        // target rotation = floor(0.9 / 0.8) + 1 = 2
        expect(near(f->rotation, 0.9f + (2.0f - 0.9f) * 0.5f));

        f = animator.advance(1.0f);
        expect(f.has_value());
        expect(near(f->startTrim, 0.49f));
    };

    "finishing ends after one cycle"_test = [] {
        RingAnimator animator;
        expect(animator.ring().setColors({RED, GREEN}).has_value());
        animator.ring().setStartTrim(0.0f);
        animator.ring().setEndTrim(0.6f);
        animator.ring().setShowArrow(true);
        animator.start();
        expect(animator.finishing());

        expect(animator.onCycleComplete().has_value());
        expect(!animator.finishing());
        expect(animator.durationMs() == 1332_i);
        expect(!animator.ring().showArrow());
        expect(animator.repeatCount() == 0_i);
        expect(animator.ring().colorIndex() == 1_i);
    };

    "stop resets regardless of state"_test = [] {
        auto animator = startedAnimator({RED, GREEN, BLUE});
        expect(animator.onCycleComplete().has_value());
        expect(animator.advance(0.3f).has_value());
        animator.ring().setShowArrow(true);

        animator.stop();
        auto f = animator.frame();
        expect(f.startTrim == 0.0_f);
        expect(f.endTrim == 0.0_f);
        expect(f.rotation == 0.0_f);
        expect(f.groupRotation == 0.0_f);
        expect(!animator.ring().showArrow());
        expect(animator.ring().colorIndex() == 0_i);
        expect(!animator.finishing());
    };
};
