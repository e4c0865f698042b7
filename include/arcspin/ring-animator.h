#pragma once

#include <arcspin/interpolator.h>
#include <arcspin/ring.h>
#include <arcspin/result.hpp>
#include <cstdint>

namespace arcspin {

//=============================================================================
// RingFrame - what the renderer needs to draw one frame
//=============================================================================
struct RingFrame {
    float startTrim = 0;
    float endTrim = 0;
    float rotation = 0;       // ring rotation, fraction of a turn
    uint32_t color = 0;       // ARGB
    float groupRotation = 0;  // whole-drawable rotation, degrees
};

//=============================================================================
// RingAnimator - per-frame trim/rotation/color interpolation
//
// Driven by a periodic source: advance(t) once per frame with the linear
// cycle fraction t, onCycleComplete() once per finished cycle. The animator
// owns the Ring; renderers only read frame().
//
// A cycle grows the arc from MIN to MAX_PROGRESS_ARC during the first half
// and shrinks it back during the second, while the palette color blends
// toward the next entry over the last quarter. Finishing mode closes an arc
// that was already open when start() was called before normal spinning.
//=============================================================================
class RingAnimator {
public:
    static constexpr float MAX_PROGRESS_ARC = 0.8f;
    static constexpr float MIN_PROGRESS_ARC = 0.01f;
    static constexpr float RING_ROTATION = 1.0f - (MAX_PROGRESS_ARC - MIN_PROGRESS_ARC);
    static constexpr float GROUP_FULL_ROTATION = 1080.0f / 5.0f;
    static constexpr float COLOR_CHANGE_OFFSET = 0.75f;
    static constexpr float SHRINK_OFFSET = 0.5f;
    static constexpr int ANIMATION_DURATION_MS = 1332;

    RingAnimator();
    explicit RingAnimator(Interpolator::Ptr ease);

    // Apply cycle fraction t in [0,1]. A t of exactly 1 only updates state
    // when isLastFrame is set, so a boundary frame racing the repeat
    // notification does not apply twice.
    Result<RingFrame> advance(float t, bool isLastFrame = false);

    // End of one full driver cycle: settle the last frame, re-snapshot and
    // move to the next palette color. Leaves finishing mode if active.
    Result<RingFrame> onCycleComplete();

    // Driver entry point combining advance() and onCycleComplete()
    Result<RingFrame> tick(float t, bool isRepeat, bool isLastFrame);

    void start();
    void stop();

    RingFrame frame() const;

    Ring& ring() { return _ring; }
    const Ring& ring() const { return _ring; }

    bool finishing() const { return _finishing; }
    int repeatCount() const { return _repeatCount; }
    float groupRotation() const { return _groupRotation; }

    // Cycle duration the driver should run with
    int durationMs() const { return _durationMs; }

    // Eased fraction used for the arc growth and shrink phases
    float ease(float input) const { return _ease->interpolation(input); }

private:
    void updateRingColor(float t);
    void applyFinishTranslation(float t);
    void applyTransformation(float t);

    Ring _ring;
    Interpolator::Ptr _ease;
    float _groupRotation = 0;
    int _repeatCount = 0;
    bool _finishing = false;
    int _durationMs = ANIMATION_DURATION_MS;
};

} // namespace arcspin
