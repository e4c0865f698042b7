#include <arcspin/ring-animator.h>
#include <ytrace/ytrace.hpp>
#include <cmath>
#include <string>

namespace arcspin {

namespace {

Interpolator::Ptr defaultEase() {
    static const Interpolator::Ptr instance = std::make_shared<FastOutSlowInInterpolator>();
    return instance;
}

} // namespace

RingAnimator::RingAnimator() : RingAnimator(defaultEase()) {}

RingAnimator::RingAnimator(Interpolator::Ptr ease)
    : _ease(ease ? std::move(ease) : defaultEase()) {}

RingFrame RingAnimator::frame() const {
    return {_ring.startTrim(), _ring.endTrim(), _ring.rotation(),
            _ring.currentColor(), _groupRotation};
}

void RingAnimator::updateRingColor(float t) {
    if (t > COLOR_CHANGE_OFFSET) {
        float fraction = (t - COLOR_CHANGE_OFFSET) / (1.0f - COLOR_CHANGE_OFFSET);
        _ring.setColor(color::blend(fraction, _ring.startingColor(), _ring.nextColor()));
    } else {
        _ring.setColor(_ring.startingColor());
    }
}

void RingAnimator::applyFinishTranslation(float t) {
    // Shrink to a point while completing the current turn
    const auto& s = _ring.originals();
    updateRingColor(t);
    float targetRotation = std::floor(s.rotation / MAX_PROGRESS_ARC) + 1.0f;
    float startTrim = s.startTrim + (s.endTrim - MIN_PROGRESS_ARC - s.startTrim) * t;
    _ring.setStartTrim(startTrim);
    _ring.setEndTrim(s.endTrim);
    _ring.setRotation(s.rotation + (targetRotation - s.rotation) * t);
}

void RingAnimator::applyTransformation(float t) {
    const auto& s = _ring.originals();
    constexpr float arcRange = MAX_PROGRESS_ARC - MIN_PROGRESS_ARC;
    float startTrim, endTrim;

    updateRingColor(t);
    if (t < SHRINK_OFFSET) {
        // Expansion: leading edge runs ahead
        float scaled = t / SHRINK_OFFSET;
        startTrim = s.startTrim;
        endTrim = startTrim + (arcRange * ease(scaled) + MIN_PROGRESS_ARC);
    } else {
        // Shrink: trailing edge catches up
        float scaled = (t - SHRINK_OFFSET) / (1.0f - SHRINK_OFFSET);
        endTrim = s.startTrim + arcRange;
        startTrim = endTrim - (arcRange * (1.0f - ease(scaled)) + MIN_PROGRESS_ARC);
    }

    _ring.setStartTrim(startTrim);
    _ring.setEndTrim(endTrim);
    _ring.setRotation(s.rotation + RING_ROTATION * t);
    _groupRotation = GROUP_FULL_ROTATION * (t + static_cast<float>(_repeatCount));
}

Result<RingFrame> RingAnimator::advance(float t, bool isLastFrame) {
    if (!(t >= 0.0f && t <= 1.0f)) {
        return Err<RingFrame>("RingAnimator::advance: t=" + std::to_string(t) + " outside [0,1]");
    }
    if (!_ring.hasOriginals()) {
        return Err<RingFrame>("RingAnimator::advance: no starting snapshot, call start() first");
    }

    if (_finishing) {
        applyFinishTranslation(t);
    } else if (t != 1.0f || isLastFrame) {
        applyTransformation(t);
    }
    return Ok(frame());
}

Result<RingFrame> RingAnimator::onCycleComplete() {
    if (auto res = advance(1.0f, true); !res) {
        return Err<RingFrame>("RingAnimator::onCycleComplete", res);
    }
    _ring.storeOriginals();
    _ring.goToNextColor();

    if (_finishing) {
        // Arc from the swipe gesture is closed; the driver restarts at full length
        ydebug("RingAnimator: finishing complete, entering spin mode");
        _finishing = false;
        _durationMs = ANIMATION_DURATION_MS;
        _repeatCount = 0;
        _ring.setShowArrow(false);
    } else {
        _repeatCount++;
    }
    return Ok(frame());
}

Result<RingFrame> RingAnimator::tick(float t, bool isRepeat, bool isLastFrame) {
    if (isRepeat) return onCycleComplete();
    return advance(t, isLastFrame);
}

void RingAnimator::start() {
    _ring.storeOriginals();
    _repeatCount = 0;
    if (_ring.endTrim() != _ring.startTrim()) {
        // Already showing part of the ring
        _finishing = true;
        _durationMs = ANIMATION_DURATION_MS / 2;
    } else {
        _finishing = false;
        _ring.resetColorIndex();
        _ring.resetOriginals();
        _durationMs = ANIMATION_DURATION_MS;
    }
    ydebug("RingAnimator::start: finishing={} duration={}ms", _finishing, _durationMs);
}

void RingAnimator::stop() {
    _groupRotation = 0;
    _ring.setShowArrow(false);
    _ring.resetColorIndex();
    _ring.resetOriginals();
    _finishing = false;
    _repeatCount = 0;
    _durationMs = ANIMATION_DURATION_MS;
    ydebug("RingAnimator::stop");
}

} // namespace arcspin
