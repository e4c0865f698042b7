//=============================================================================
// ProgressDrawable tests
//
// Style presets, drawing geometry through a DrawList, animation lifecycle
// through tick().
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <arcspin/draw-list.h>
#include <arcspin/progress-drawable.h>

#include <cmath>

using namespace boost::ut;
using namespace arcspin;

static bool near(float a, float b, float eps = 1e-3f) { return std::fabs(a - b) <= eps; }

static ProgressDrawable::Ptr makeSpinner(float density = 1.0f) {
    auto res = ProgressDrawable::create(density);
    return res ? *res : nullptr;
}

static DrawList::Ptr drawn(const ProgressDrawable::Ptr& spinner) {
    auto list = *DrawList::create();
    spinner->draw(*list);
    return list;
}

static const DrawPrim* findPrim(const DrawList::Ptr& list, DrawPrim::Type type) {
    for (const auto& p : list->prims()) {
        if (p.type == type) return &p;
    }
    return nullptr;
}

suite progress_drawable_setup_tests = [] {
    "density must be positive"_test = [] {
        expect(!ProgressDrawable::create(0.0f).has_value());
        expect(!ProgressDrawable::create(-1.0f).has_value());
    };

    "fresh drawable defaults"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner != nullptr);
        expect(spinner->strokeWidth() == 2.5_f);
        expect(spinner->colorSchemeColors().size() == 1_u);
        expect(spinner->colorSchemeColors()[0] == color::CYAN);
        expect(!spinner->arrowEnabled());
        expect(spinner->alpha() == 255_i);
        expect(!spinner->isRunning());
    };

    "large style scales with density"_test = [] {
        auto spinner = makeSpinner(2.0f);
        spinner->setStyle(ProgressDrawable::Style::Large);
        expect(spinner->centerRadius() == 22.0_f);
        expect(spinner->strokeWidth() == 6.0_f);
        expect(spinner->arrowWidth() == 24.0_f);
        expect(spinner->arrowHeight() == 12.0_f);
    };

    "default style scales with density"_test = [] {
        auto spinner = makeSpinner(2.0f);
        spinner->setStyle(ProgressDrawable::Style::Default);
        expect(spinner->centerRadius() == 15.0_f);
        expect(spinner->strokeWidth() == 5.0_f);
        expect(spinner->arrowWidth() == 16.0_f);
        expect(spinner->arrowHeight() == 8.0_f);
    };

    "style change restarts the palette"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner->setColorSchemeColors({0xFFFF0000u, 0xFF00FF00u}).has_value());
        expect(spinner->start().has_value());
        expect(spinner->tick(1332.0).has_value());
        expect(spinner->animator().ring().colorIndex() == 1_i);
        spinner->setStyle(ProgressDrawable::Style::Large);
        expect(spinner->animator().ring().colorIndex() == 0_i);
    };

    "empty palette and bad alpha are rejected"_test = [] {
        auto spinner = makeSpinner();
        expect(!spinner->setColorSchemeColors({}).has_value());
        expect(!spinner->setAlpha(300).has_value());
        expect(spinner->alpha() == 255_i);
    };

    "setters invalidate"_test = [] {
        auto spinner = makeSpinner();
        int count = 0;
        spinner->setInvalidateCallback([&count] { count++; });
        spinner->setStrokeWidth(3.0f);
        spinner->setArrowEnabled(true);
        spinner->setStartEndTrim(0.0f, 0.2f);
        spinner->setBackgroundColor(0xFF000000u);
        expect(count == 4_i);
    };
};

suite progress_drawable_draw_tests = [] {
    "arc uses centre radius plus half stroke"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        spinner->setStartEndTrim(0.1f, 0.35f);
        spinner->setProgressRotation(0.25f);

        auto list = drawn(spinner);
        // transparent background disc is culled
        expect(list->size() == 1_u);
        const auto* arc = findPrim(list, DrawPrim::Type::Arc);
        expect(arc != nullptr);
        expect(near(arc->radiusX, 8.75f));
        expect(near(arc->center.x, 24.0f));
        expect(near(arc->center.y, 24.0f));
        expect(near(arc->startAngle, 126.0f));
        expect(near(arc->sweepAngle, 90.0f));
        expect(near(arc->paint.strokeWidth, 2.5f));
        expect(arc->paint.style == Paint::Style::Stroke);
    };

    "background disc sits inside the stroke"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        spinner->setBackgroundColor(0xFFFAFAFAu);

        auto list = drawn(spinner);
        expect(list->size() == 2_u);
        const auto* disc = findPrim(list, DrawPrim::Type::Circle);
        expect(disc != nullptr);
        expect(near(disc->radiusX, 7.5f));
        expect(disc->paint.color == 0xFFFAFAFAu);
    };

    "zero centre radius fills the bounds"_test = [] {
        auto spinner = makeSpinner();
        spinner->setBounds({0, 0, 48, 48});
        spinner->setCenterRadius(0.0f);
        spinner->setStrokeWidth(4.0f);
        spinner->setArrowDimensions(8.0f, 4.0f);
        spinner->setStartEndTrim(0.0f, 0.5f);

        auto list = drawn(spinner);
        const auto* arc = findPrim(list, DrawPrim::Type::Arc);
        expect(arc != nullptr);
        // 48/2 - max(8/2, 4/2)
        expect(near(arc->radiusX, 20.0f));
    };

    "ring alpha replaces the color alpha"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        expect(spinner->setAlpha(128).has_value());
        auto list = drawn(spinner);
        const auto* arc = findPrim(list, DrawPrim::Type::Arc);
        expect(arc != nullptr);
        expect(arc->paint.color == 0x8000FFFFu);
    };

    "color filter recolors the arc only"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        spinner->setArrowEnabled(true);
        int invalidations = 0;
        spinner->setInvalidateCallback([&invalidations] { invalidations++; });

        spinner->setColorFilter([](uint32_t argb) { return (argb & 0xFF000000u) | 0x00808080u; });
        expect(spinner->hasColorFilter());
        expect(invalidations == 1_i);

        auto list = drawn(spinner);
        expect(findPrim(list, DrawPrim::Type::Arc)->paint.color == 0xFF808080u);
        expect(findPrim(list, DrawPrim::Type::Triangle)->paint.color == color::CYAN);

        spinner->setColorFilter(nullptr);
        expect(!spinner->hasColorFilter());
        list = drawn(spinner);
        expect(findPrim(list, DrawPrim::Type::Arc)->paint.color == color::CYAN);
    };

    "arrow sits at the leading edge"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        spinner->setArrowEnabled(true);
        spinner->setStartEndTrim(0.0f, 0.25f);

        auto list = drawn(spinner);
        const auto* tri = findPrim(list, DrawPrim::Type::Triangle);
        expect(tri != nullptr);
        // Unrotated p0 (28.75, 25.25), tip (32.75, 29.25); turned 90 deg about the centre
        expect(near(tri->points[0].x, 22.75f));
        expect(near(tri->points[0].y, 28.75f));
        expect(near(tri->points[2].x, 18.75f));
        expect(near(tri->points[2].y, 32.75f));
        expect(tri->paint.color == color::CYAN);
    };

    "arrow scale enlarges the head"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        spinner->setArrowEnabled(true);
        spinner->setArrowScale(2.0f);

        auto list = drawn(spinner);
        const auto* tri = findPrim(list, DrawPrim::Type::Triangle);
        expect(tri != nullptr);
        float width = std::hypot(tri->points[1].x - tri->points[0].x,
                                 tri->points[1].y - tri->points[0].y);
        expect(near(width, 16.0f));
    };

    "group rotation turns the whole drawing"_test = [] {
        auto spinner = makeSpinner();
        spinner->setStyle(ProgressDrawable::Style::Default);
        spinner->setBounds({0, 0, 48, 48});
        expect(spinner->start().has_value());
        expect(spinner->tick(666.0).has_value());

        auto list = drawn(spinner);
        const auto* arc = findPrim(list, DrawPrim::Type::Arc);
        expect(arc != nullptr);
        const float expected = (spinner->startTrim() + spinner->progressRotation()) * 360.0f +
                               spinner->groupRotation();
        expect(near(arc->startAngle, expected));
        expect(near(spinner->groupRotation(), 108.0f, 0.2f));
    };
};

suite progress_drawable_animation_tests = [] {
    "start runs the driver and ticks invalidate"_test = [] {
        auto spinner = makeSpinner();
        int count = 0;
        spinner->setInvalidateCallback([&count] { count++; });
        expect(spinner->start().has_value());
        expect(spinner->isRunning());
        const int afterStart = count;
        expect(spinner->tick(16.0).has_value());
        expect(count > afterStart);
        expect(spinner->endTrim() > spinner->startTrim());
    };

    "each cycle moves to the next color"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner->setColorSchemeColors({0xFFFF0000u, 0xFF00FF00u, 0xFF0000FFu}).has_value());
        expect(spinner->start().has_value());
        expect(spinner->tick(1332.0).has_value());
        expect(spinner->animator().ring().colorIndex() == 1_i);
        expect(spinner->tick(1332.0).has_value());
        expect(spinner->animator().ring().colorIndex() == 2_i);
        expect(spinner->animator().repeatCount() == 2_i);
    };

    "open arc finishes then spins at full duration"_test = [] {
        auto spinner = makeSpinner();
        spinner->setArrowEnabled(true);
        spinner->setStartEndTrim(0.0f, 0.5f);
        expect(spinner->start().has_value());
        expect(spinner->animator().finishing());
        expect(spinner->animator().durationMs() == 666_i);

        expect(spinner->tick(333.0).has_value());
        expect(near(spinner->startTrim(), (0.5f - 0.01f) * 0.5f));
        expect(near(spinner->endTrim(), 0.5f));

        expect(spinner->tick(333.0).has_value());
        expect(!spinner->animator().finishing());
        expect(spinner->animator().durationMs() == 1332_i);
        expect(!spinner->arrowEnabled());
        expect(spinner->isRunning());
        expect(spinner->animator().repeatCount() == 0_i);
    };

    "stop clears the frame"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner->setColorSchemeColors({0xFFFF0000u, 0xFF00FF00u}).has_value());
        spinner->setArrowEnabled(true);
        expect(spinner->start().has_value());
        expect(spinner->tick(2000.0).has_value());

        spinner->stop();
        expect(!spinner->isRunning());
        auto f = spinner->frame();
        expect(f.startTrim == 0.0_f);
        expect(f.endTrim == 0.0_f);
        expect(f.rotation == 0.0_f);
        expect(f.groupRotation == 0.0_f);
        expect(f.color == 0xFFFF0000u);
        expect(!spinner->arrowEnabled());
    };

    "bad tick deltas fail without stalling the spinner"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner->start().has_value());
        expect(!spinner->tick(std::nan("")).has_value());
        expect(!spinner->tick(INFINITY).has_value());
        expect(spinner->tick(1e20).has_value());
        expect(spinner->isRunning());
        expect(spinner->tick(16.0).has_value());
        expect(spinner->endTrim() >= spinner->startTrim());
    };

    "tick while stopped changes nothing"_test = [] {
        auto spinner = makeSpinner();
        expect(spinner->tick(100.0).has_value());
        expect(spinner->frame().endTrim == 0.0_f);
    };
};
