#pragma once

#include "types.h"
#include <cstdint>

namespace arcspin {
namespace base {

struct Event {
    enum class Type {
        None,
        // Frame timer fired
        Timer,
        // Drawable requested a redraw
        Invalidate
    };

    // deltaMs is measured wall time since the previous fire (or since
    // startTimer() for the first one), not the configured interval.
    struct TimerEvent {
        int timerId;
        double deltaMs;
        uint64_t fireCount;
    };

    struct InvalidateEvent {
        ObjectId objectId;
    };

    Type type = Type::None;

    union {
        TimerEvent timer;
        InvalidateEvent invalidate;
    };

    static Event timerEvent(int timerId, double deltaMs, uint64_t fireCount) {
        Event e;
        e.type = Type::Timer;
        e.timer = {timerId, deltaMs, fireCount};
        return e;
    }

    static Event invalidateEvent(ObjectId objectId) {
        Event e;
        e.type = Type::Invalidate;
        e.invalidate = {objectId};
        return e;
    }
};

} // namespace base
} // namespace arcspin
