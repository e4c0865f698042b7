#pragma once

#include <arcspin/base/object.h>
#include <arcspin/base/factory.h>
#include <arcspin/interpolator.h>
#include <arcspin/result.hpp>
#include <cstdint>
#include <functional>

namespace arcspin {

//=============================================================================
// FrameDriver - periodic fraction source for frame-based animation
//
// Turns elapsed time into a cycle fraction in [0,1] over durationMs and
// repeats forever, restarting from 0 on each cycle. The host feeds wall time
// through advance(); listeners see start/update/repeat/cancel in that order.
//
// A repeat listener may cancel() or start() the driver again; the remainder
// of the delta that crossed the boundary is then dropped. A single delta that
// spans more than MAX_REPEATS_PER_ADVANCE cycles notifies only that many
// repeats; the rest are counted in repeatCount() without a callback.
//=============================================================================
class FrameDriver : public base::Object,
                    public base::ObjectFactory<FrameDriver> {
public:
    using Ptr = base::ObjectFactory<FrameDriver>::Ptr;

    struct Listener {
        std::function<void()> onStart;
        std::function<Result<void>(float fraction)> onUpdate;
        std::function<Result<void>()> onRepeat;
        std::function<void()> onCancel;
    };

    static constexpr int MAX_REPEATS_PER_ADVANCE = 64;

    static Result<Ptr> createImpl(int durationMs);

    ~FrameDriver() override = default;
    const char* typeName() const override { return "FrameDriver"; }

    virtual void setListener(Listener listener) = 0;

    // Playback control. start() emits onStart and the first update at 0.
    virtual Result<void> start() = 0;
    virtual void cancel() = 0;

    // Advance wall time in milliseconds. NaN, infinite and negative deltas
    // are errors and leave the driver untouched.
    virtual Result<void> advance(double deltaMs) = 0;

    // Configuration
    virtual Result<void> setDuration(int durationMs) = 0;
    virtual void setInterpolator(Interpolator::Ptr interpolator) = 0;

    // State queries
    virtual bool isRunning() const = 0;
    virtual int durationMs() const = 0;
    virtual double elapsedMs() const = 0;
    virtual float fraction() const = 0;
    // Cycles completed since the last start()
    virtual uint32_t repeatCount() const = 0;

protected:
    FrameDriver() = default;
};

} // namespace arcspin
