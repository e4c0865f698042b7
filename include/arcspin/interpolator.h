#pragma once

#include <array>
#include <memory>

namespace arcspin {

//=============================================================================
// Interpolator - maps elapsed fraction [0,1] to an eased fraction
//=============================================================================
class Interpolator {
public:
    using Ptr = std::shared_ptr<const Interpolator>;

    virtual ~Interpolator() = default;

    virtual float interpolation(float input) const = 0;
};

class LinearInterpolator : public Interpolator {
public:
    float interpolation(float input) const override { return input; }
};

//=============================================================================
// CubicBezierInterpolator - CSS-style cubic-bezier(x1, y1, x2, y2) easing
//
// The curve is sampled once into a lookup table (x solved by bisection);
// interpolation() clamps to [0,1] and interpolates linearly between samples.
//=============================================================================
class CubicBezierInterpolator : public Interpolator {
public:
    static constexpr int SAMPLE_COUNT = 201;

    CubicBezierInterpolator(float x1, float y1, float x2, float y2);

    float interpolation(float input) const override;

private:
    std::array<float, SAMPLE_COUNT> _values{};
};

// Material "fast out, slow in": cubic-bezier(0.4, 0, 0.2, 1)
class FastOutSlowInInterpolator : public CubicBezierInterpolator {
public:
    FastOutSlowInInterpolator() : CubicBezierInterpolator(0.4f, 0.0f, 0.2f, 1.0f) {}
};

} // namespace arcspin
