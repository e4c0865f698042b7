#include <arcspin/progress-drawable.h>
#include <arcspin/frame-driver.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <string>

namespace arcspin {

//=============================================================================
// ProgressDrawableImpl
//=============================================================================

class ProgressDrawableImpl : public ProgressDrawable {
public:
    explicit ProgressDrawableImpl(float density) : _density(density) {}

    Result<void> init() {
        auto driverRes = FrameDriver::create(RingAnimator::ANIMATION_DURATION_MS);
        if (!driverRes) {
            return Err<void>("ProgressDrawable: failed to create frame driver", driverRes);
        }
        _driver = *driverRes;

        FrameDriver::Listener listener;
        listener.onUpdate = [this](float t) -> Result<void> {
            if (auto res = _animator.advance(t); !res) {
                return Err<void>("ProgressDrawable: frame update failed", res);
            }
            invalidate();
            return Ok();
        };
        listener.onRepeat = [this]() -> Result<void> {
            return onRepeat();
        };
        _driver->setListener(std::move(listener));

        _animator.ring().setStrokeWidth(STROKE_WIDTH);
        return Ok();
    }

    void setInvalidateCallback(InvalidateCallback callback) override {
        _invalidate = std::move(callback);
    }

    void setStyle(Style style) override {
        if (style == Style::Large) {
            setSizeParameters(CENTER_RADIUS_LARGE, STROKE_WIDTH_LARGE,
                              ARROW_WIDTH_LARGE, ARROW_HEIGHT_LARGE);
        } else {
            setSizeParameters(CENTER_RADIUS, STROKE_WIDTH, ARROW_WIDTH, ARROW_HEIGHT);
        }
        invalidate();
    }

    float density() const override { return _density; }

    //=========================================================================
    // Geometry
    //=========================================================================

    void setStrokeWidth(float strokeWidth) override {
        ring().setStrokeWidth(strokeWidth);
        invalidate();
    }
    float strokeWidth() const override { return ring().strokeWidth(); }

    void setCenterRadius(float centerRadius) override {
        ring().setCenterRadius(centerRadius);
        invalidate();
    }
    float centerRadius() const override { return ring().centerRadius(); }

    void setStrokeCap(StrokeCap cap) override {
        ring().setStrokeCap(cap);
        invalidate();
    }
    StrokeCap strokeCap() const override { return ring().strokeCap(); }

    void setBounds(const RectF& bounds) override {
        _bounds = bounds;
        invalidate();
    }
    RectF bounds() const override { return _bounds; }

    //=========================================================================
    // Arrow
    //=========================================================================

    void setArrowDimensions(float width, float height) override {
        ring().setArrowDimensions(width, height);
        invalidate();
    }
    float arrowWidth() const override { return ring().arrowWidth(); }
    float arrowHeight() const override { return ring().arrowHeight(); }

    void setArrowEnabled(bool show) override {
        ring().setShowArrow(show);
        invalidate();
    }
    bool arrowEnabled() const override { return ring().showArrow(); }

    void setArrowScale(float scale) override {
        ring().setArrowScale(scale);
        invalidate();
    }
    float arrowScale() const override { return ring().arrowScale(); }

    //=========================================================================
    // Arc position
    //=========================================================================

    void setStartEndTrim(float start, float end) override {
        ring().setStartTrim(start);
        ring().setEndTrim(end);
        invalidate();
    }
    float startTrim() const override { return ring().startTrim(); }
    float endTrim() const override { return ring().endTrim(); }

    void setProgressRotation(float rotation) override {
        ring().setRotation(rotation);
        invalidate();
    }
    float progressRotation() const override { return ring().rotation(); }

    float groupRotation() const override { return _animator.groupRotation(); }

    //=========================================================================
    // Colors
    //=========================================================================

    void setBackgroundColor(uint32_t color) override {
        ring().setBackgroundColor(color);
        invalidate();
    }
    uint32_t backgroundColor() const override { return ring().backgroundColor(); }

    Result<void> setColorSchemeColors(std::vector<uint32_t> colors) override {
        if (auto res = ring().setColors(std::move(colors)); !res) {
            return Err<void>("ProgressDrawable::setColorSchemeColors", res);
        }
        invalidate();
        return Ok();
    }
    const std::vector<uint32_t>& colorSchemeColors() const override {
        return ring().colors();
    }

    Result<void> setAlpha(int alpha) override {
        if (auto res = ring().setAlpha(alpha); !res) {
            return Err<void>("ProgressDrawable::setAlpha", res);
        }
        invalidate();
        return Ok();
    }
    int alpha() const override { return ring().alpha(); }

    void setColorFilter(ColorFilter filter) override {
        _colorFilter = std::move(filter);
        invalidate();
    }
    bool hasColorFilter() const override { return static_cast<bool>(_colorFilter); }

    //=========================================================================
    // Animation
    //=========================================================================

    Result<void> start() override {
        _driver->cancel();
        _animator.start();
        if (auto res = _driver->setDuration(_animator.durationMs()); !res) {
            return Err<void>("ProgressDrawable::start", res);
        }
        if (auto res = _driver->start(); !res) {
            return Err<void>("ProgressDrawable::start", res);
        }
        ydebug("ProgressDrawable::start: finishing={}", _animator.finishing());
        return Ok();
    }

    void stop() override {
        _driver->cancel();
        _animator.stop();
        invalidate();
    }

    bool isRunning() const override { return _driver->isRunning(); }

    Result<void> tick(double deltaMs) override {
        if (auto res = _driver->advance(deltaMs); !res) {
            return Err<void>("ProgressDrawable::tick", res);
        }
        return Ok();
    }

    //=========================================================================
    // Drawing
    //=========================================================================

    void draw(Canvas& canvas) const override {
        canvas.save();
        canvas.rotate(_animator.groupRotation(), _bounds.centerX(), _bounds.centerY());
        drawRing(canvas);
        canvas.restore();
    }

    RingFrame frame() const override { return _animator.frame(); }
    const RingAnimator& animator() const override { return _animator; }

private:
    Ring& ring() { return _animator.ring(); }
    const Ring& ring() const { return _animator.ring(); }

    void invalidate() {
        if (_invalidate) _invalidate();
    }

    void setSizeParameters(float centerRadius, float strokeWidth,
                           float arrowWidth, float arrowHeight) {
        Ring& r = ring();
        r.setStrokeWidth(strokeWidth * _density);
        r.setCenterRadius(centerRadius * _density);
        r.resetColorIndex();
        r.setArrowDimensions(arrowWidth * _density, arrowHeight * _density);
    }

    Result<void> onRepeat() {
        const bool wasFinishing = _animator.finishing();
        if (auto res = _animator.onCycleComplete(); !res) {
            return Err<void>("ProgressDrawable: cycle completion failed", res);
        }
        if (wasFinishing) {
            // Arc closed, restart as a full length spin
            _driver->cancel();
            if (auto res = _driver->setDuration(_animator.durationMs()); !res) {
                return Err<void>("ProgressDrawable: driver restart failed", res);
            }
            if (auto res = _driver->start(); !res) {
                return Err<void>("ProgressDrawable: driver restart failed", res);
            }
        }
        invalidate();
        return Ok();
    }

    void drawRing(Canvas& canvas) const {
        const Ring& r = ring();
        const float stroke = r.strokeWidth();
        const float cx = _bounds.centerX();
        const float cy = _bounds.centerY();

        float arcRadius = r.centerRadius() + stroke / 2.0f;
        if (r.centerRadius() <= 0) {
            // No explicit radius: fill the bounds
            arcRadius = std::min(_bounds.width(), _bounds.height()) / 2.0f -
                        std::max(r.arrowWidth() * r.arrowScale() / 2.0f, stroke / 2.0f);
        }
        RectF arcBounds{cx - arcRadius, cy - arcRadius, cx + arcRadius, cy + arcRadius};

        const float startAngle = (r.startTrim() + r.rotation()) * 360.0f;
        const float endAngle = (r.endTrim() + r.rotation()) * 360.0f;
        const float sweepAngle = endAngle - startAngle;

        // Background disc sits inside the stroke
        Paint circlePaint;
        circlePaint.color = r.backgroundColor();
        circlePaint.style = Paint::Style::Fill;

        RectF discBounds = arcBounds;
        discBounds.inset(stroke / 2.0f, stroke / 2.0f);
        canvas.drawCircle(discBounds.centerX(), discBounds.centerY(),
                          discBounds.width() / 2.0f, circlePaint);

        Paint arcPaint;
        arcPaint.color = color::withAlpha(r.currentColor(), static_cast<uint32_t>(r.alpha()));
        if (_colorFilter) arcPaint.color = _colorFilter(arcPaint.color);
        arcPaint.style = Paint::Style::Stroke;
        arcPaint.strokeWidth = stroke;
        arcPaint.cap = r.strokeCap();
        canvas.drawArc(arcBounds, startAngle, sweepAngle, arcPaint);

        if (r.showArrow()) {
            drawArrow(canvas, startAngle, sweepAngle, arcBounds);
        }
    }

    void drawArrow(Canvas& canvas, float startAngle, float sweepAngle,
                   const RectF& arcBounds) const {
        const Ring& r = ring();
        const float w = r.arrowWidth() * r.arrowScale();
        const float h = r.arrowHeight() * r.arrowScale();
        const float centerRadius = std::min(arcBounds.width(), arcBounds.height()) / 2.0f;

        // Triangle pointing inward at angle 0, offset onto the arc
        const float ox = centerRadius + arcBounds.centerX() - w / 2.0f;
        const float oy = arcBounds.centerY() + r.strokeWidth() / 2.0f;
        PointF p0{ox, oy};
        PointF p1{ox + w, oy};
        PointF p2{ox + w / 2.0f, oy + h};

        Paint arrowPaint;
        arrowPaint.color = color::withAlpha(r.currentColor(), static_cast<uint32_t>(r.alpha()));
        arrowPaint.style = Paint::Style::Fill;

        canvas.save();
        canvas.rotate(startAngle + sweepAngle, arcBounds.centerX(), arcBounds.centerY());
        canvas.drawTriangle(p0, p1, p2, arrowPaint);
        canvas.restore();
    }

    float _density;
    RectF _bounds;
    RingAnimator _animator;
    FrameDriver::Ptr _driver;
    InvalidateCallback _invalidate;
    ColorFilter _colorFilter;
};

//=============================================================================
// Factory
//=============================================================================

Result<ProgressDrawable::Ptr> ProgressDrawable::createImpl(float density) {
    if (!(density > 0.0f)) {
        return Err<Ptr>("ProgressDrawable: density must be positive, got " +
                        std::to_string(density));
    }
    auto impl = std::shared_ptr<ProgressDrawableImpl>(new ProgressDrawableImpl(density));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to create ProgressDrawable", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace arcspin
