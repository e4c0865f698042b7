#include <arcspin/interpolator.h>
#include <algorithm>

namespace arcspin {

namespace {

// One axis of a cubic bezier with endpoints fixed at 0 and 1
double bezierAxis(double t, double p1, double p2) {
    double mt = 1.0 - t;
    return 3.0 * mt * mt * t * p1 + 3.0 * mt * t * t * p2 + t * t * t;
}

// Curve parameter for a given x. x(t) is monotonic for 0 <= x1, x2 <= 1.
double solveForX(double x, double x1, double x2) {
    double lo = 0.0, hi = 1.0;
    for (int i = 0; i < 48; ++i) {
        double mid = 0.5 * (lo + hi);
        if (bezierAxis(mid, x1, x2) < x) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

} // namespace

CubicBezierInterpolator::CubicBezierInterpolator(float x1, float y1, float x2, float y2) {
    const double cx1 = std::clamp(static_cast<double>(x1), 0.0, 1.0);
    const double cx2 = std::clamp(static_cast<double>(x2), 0.0, 1.0);
    for (int i = 0; i < SAMPLE_COUNT; ++i) {
        double x = static_cast<double>(i) / (SAMPLE_COUNT - 1);
        double t = solveForX(x, cx1, cx2);
        _values[i] = static_cast<float>(bezierAxis(t, y1, y2));
    }
    _values.front() = 0.0f;
    _values.back() = 1.0f;
}

float CubicBezierInterpolator::interpolation(float input) const {
    if (input <= 0.0f) return 0.0f;
    if (input >= 1.0f) return 1.0f;

    float position = input * (SAMPLE_COUNT - 1);
    int index = std::min(static_cast<int>(position), SAMPLE_COUNT - 2);
    float weight = position - static_cast<float>(index);
    return _values[index] + weight * (_values[index + 1] - _values[index]);
}

} // namespace arcspin
