#pragma once

#include <arcspin/ring.h>
#include <cstdint>

namespace arcspin {

struct PointF {
    float x = 0;
    float y = 0;
};

struct RectF {
    float left = 0;
    float top = 0;
    float right = 0;
    float bottom = 0;

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    float centerX() const { return (left + right) * 0.5f; }
    float centerY() const { return (top + bottom) * 0.5f; }

    void inset(float dx, float dy) {
        left += dx;
        top += dy;
        right -= dx;
        bottom -= dy;
    }
};

struct Paint {
    enum class Style : uint8_t { Fill, Stroke };

    uint32_t color = 0xFF000000;  // ARGB
    Style style = Style::Fill;
    float strokeWidth = 0;
    StrokeCap cap = StrokeCap::Butt;
};

//=============================================================================
// Canvas - drawing surface the progress drawable renders into
//
// Angles are in degrees, clockwise from the positive x axis (y points down).
// rotate() applies to everything drawn until the matching restore().
//=============================================================================
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void save() = 0;
    virtual void restore() = 0;
    virtual void rotate(float degrees, float px, float py) = 0;

    virtual void drawCircle(float cx, float cy, float radius, const Paint& paint) = 0;
    virtual void drawArc(const RectF& oval, float startAngle, float sweepAngle,
                         const Paint& paint) = 0;
    virtual void drawTriangle(PointF p0, PointF p1, PointF p2, const Paint& paint) = 0;
};

} // namespace arcspin
