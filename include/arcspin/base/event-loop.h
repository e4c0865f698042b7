#pragma once

#include "factory.h"
#include "event.h"
#include "event-listener.h"
#include <cstddef>

namespace arcspin {
namespace base {

using TimerId = int;
using Timeout = int;

//=============================================================================
// EventLoop - per-thread libuv loop that clocks frame animation
//
// Frame timers repeat at a fixed interval and hand their single listener a
// Timer event carrying the measured time since the previous fire, so hosts
// advance animations by real elapsed time instead of the nominal interval.
// Invalidate and other events go through prioritized dispatch().
//=============================================================================
class EventLoop : public ThreadSingleton<EventLoop> {
public:
    using Ptr = std::shared_ptr<EventLoop>;

    static Result<Ptr> createImpl() noexcept;

    virtual ~EventLoop() = default;

    // Run until stop() or until no active handle remains (blocking)
    virtual int start() = 0;
    virtual Result<void> stop() = 0;

    // One non-blocking pass; completes the close of destroyed timers when
    // the loop is not running
    virtual Result<void> drain() = 0;

    // Monotonic clock in milliseconds with sub-millisecond resolution
    virtual double nowMs() const = 0;

    // Prioritized dispatch, higher priority first (default 0)
    virtual Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) = 0;
    virtual Result<void> deregisterListener(Event::Type type, EventListener::Ptr listener) = 0;
    virtual Result<void> deregisterListener(EventListener::Ptr listener) = 0;
    virtual Result<bool> dispatch(const Event& event) = 0;

    // Frame timers. A listener error stops its timer.
    virtual Result<TimerId> addTimer(Timeout intervalMs, EventListener::Ptr listener) = 0;
    virtual Result<void> setTimerInterval(TimerId id, Timeout intervalMs) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual bool timerActive(TimerId id) const = 0;

    // Destroyed timers whose libuv close callback has not run yet
    virtual size_t closingTimers() const = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace arcspin
