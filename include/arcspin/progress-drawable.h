#pragma once

#include <arcspin/base/object.h>
#include <arcspin/base/factory.h>
#include <arcspin/canvas.h>
#include <arcspin/ring-animator.h>
#include <arcspin/result.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace arcspin {

//=============================================================================
// ProgressDrawable - indeterminate circular progress spinner
//
// Owns a RingAnimator and the FrameDriver that clocks it. The host advances
// time with tick() and renders with draw(); the invalidate callback fires
// whenever the drawn output would change.
//
// Sizes set through setStyle() are in density independent units and get
// multiplied by the display density. The direct setters take pixels.
//=============================================================================
class ProgressDrawable : public base::Object,
                         public base::ObjectFactory<ProgressDrawable> {
public:
    using Ptr = base::ObjectFactory<ProgressDrawable>::Ptr;
    using InvalidateCallback = std::function<void()>;
    // Maps the final ARGB arc color to the color actually painted
    using ColorFilter = std::function<uint32_t(uint32_t argb)>;

    enum class Style : uint8_t {
        Large,
        Default,
    };

    // Style presets, density independent
    static constexpr float CENTER_RADIUS_LARGE = 11.0f;
    static constexpr float STROKE_WIDTH_LARGE = 3.0f;
    static constexpr int ARROW_WIDTH_LARGE = 12;
    static constexpr int ARROW_HEIGHT_LARGE = 6;

    static constexpr float CENTER_RADIUS = 7.5f;
    static constexpr float STROKE_WIDTH = 2.5f;
    static constexpr int ARROW_WIDTH = 8;
    static constexpr int ARROW_HEIGHT = 4;

    static Result<Ptr> createImpl(float density);

    ~ProgressDrawable() override = default;
    const char* typeName() const override { return "ProgressDrawable"; }

    virtual void setInvalidateCallback(InvalidateCallback callback) = 0;

    virtual void setStyle(Style style) = 0;
    virtual float density() const = 0;

    // Geometry
    virtual void setStrokeWidth(float strokeWidth) = 0;
    virtual float strokeWidth() const = 0;
    virtual void setCenterRadius(float centerRadius) = 0;
    virtual float centerRadius() const = 0;
    virtual void setStrokeCap(StrokeCap cap) = 0;
    virtual StrokeCap strokeCap() const = 0;
    virtual void setBounds(const RectF& bounds) = 0;
    virtual RectF bounds() const = 0;

    // Arrow
    virtual void setArrowDimensions(float width, float height) = 0;
    virtual float arrowWidth() const = 0;
    virtual float arrowHeight() const = 0;
    virtual void setArrowEnabled(bool show) = 0;
    virtual bool arrowEnabled() const = 0;
    virtual void setArrowScale(float scale) = 0;
    virtual float arrowScale() const = 0;

    // Arc position, fractions of a turn
    virtual void setStartEndTrim(float start, float end) = 0;
    virtual float startTrim() const = 0;
    virtual float endTrim() const = 0;
    virtual void setProgressRotation(float rotation) = 0;
    virtual float progressRotation() const = 0;

    // Whole drawable rotation in degrees
    virtual float groupRotation() const = 0;

    // Colors
    virtual void setBackgroundColor(uint32_t color) = 0;
    virtual uint32_t backgroundColor() const = 0;
    virtual Result<void> setColorSchemeColors(std::vector<uint32_t> colors) = 0;
    virtual const std::vector<uint32_t>& colorSchemeColors() const = 0;
    virtual Result<void> setAlpha(int alpha) = 0;
    virtual int alpha() const = 0;
    // Applies to the arc stroke only; the arrow and background keep their
    // colors. Pass nullptr to clear.
    virtual void setColorFilter(ColorFilter filter) = 0;
    virtual bool hasColorFilter() const = 0;

    // Animation
    virtual Result<void> start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
    virtual Result<void> tick(double deltaMs) = 0;

    virtual void draw(Canvas& canvas) const = 0;
    virtual RingFrame frame() const = 0;
    virtual const RingAnimator& animator() const = 0;

protected:
    ProgressDrawable() = default;
};

} // namespace arcspin
