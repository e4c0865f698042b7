#include <arcspin/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace arcspin {
namespace base {

namespace {

double nsToMs(uint64_t ns) {
    return static_cast<double>(ns) / 1.0e6;
}

//=============================================================================
// ListenerTable - per event type, sorted by descending priority
//=============================================================================
class ListenerTable {
public:
    void add(Event::Type type, const EventListener::Ptr& listener, int priority) {
        auto& entries = _byType[static_cast<size_t>(type)];
        Entry entry{listener, priority};
        // upper_bound keeps registration order among equal priorities
        auto pos = std::upper_bound(entries.begin(), entries.end(), entry,
            [](const Entry& a, const Entry& b) { return a.priority > b.priority; });
        entries.insert(pos, std::move(entry));
    }

    void remove(Event::Type type, const EventListener::Ptr& listener) {
        auto it = _byType.find(static_cast<size_t>(type));
        if (it != _byType.end()) prune(it->second, listener);
    }

    void removeEverywhere(const EventListener::Ptr& listener) {
        for (auto& [type, entries] : _byType) prune(entries, listener);
    }

    // Snapshot of live listeners, so handlers may (de)register during dispatch
    std::vector<EventListener::Ptr> live(Event::Type type) const {
        std::vector<EventListener::Ptr> out;
        auto it = _byType.find(static_cast<size_t>(type));
        if (it == _byType.end()) return out;
        out.reserve(it->second.size());
        for (const auto& entry : it->second) {
            if (auto sp = entry.listener.lock()) out.push_back(std::move(sp));
        }
        return out;
    }

private:
    struct Entry {
        std::weak_ptr<EventListener> listener;
        int priority;
    };

    // Drops the listener and any expired entry
    static void prune(std::vector<Entry>& entries, const EventListener::Ptr& listener) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
            [&](const Entry& e) {
                auto sp = e.listener.lock();
                return !sp || sp == listener;
            }),
            entries.end());
    }

    std::unordered_map<size_t, std::vector<Entry>> _byType;
};

} // namespace

//=============================================================================
// EventLoopImpl
//=============================================================================

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() : _loop(uv_default_loop()) {}

    ~EventLoopImpl() override = default;

    int start() override {
        yinfo("EventLoop::start: {} timer(s)", _timers.size());
        return uv_run(_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(_loop);
        return Ok();
    }

    Result<void> drain() override {
        uv_run(_loop, UV_RUN_NOWAIT);
        if (_closing != 0) {
            return Err<void>("EventLoop::drain: " + std::to_string(_closing) +
                             " timer(s) still closing");
        }
        return Ok();
    }

    double nowMs() const override { return nsToMs(uv_hrtime()); }

    //=========================================================================
    // Dispatch
    //=========================================================================

    Result<void> registerListener(Event::Type type, EventListener::Ptr listener,
                                  int priority = 0) override {
        if (!listener) return Err<void>("EventLoop::registerListener: null listener");
        _listeners.add(type, listener, priority);
        return Ok();
    }

    Result<void> deregisterListener(Event::Type type, EventListener::Ptr listener) override {
        _listeners.remove(type, listener);
        return Ok();
    }

    Result<void> deregisterListener(EventListener::Ptr listener) override {
        _listeners.removeEverywhere(listener);
        return Ok();
    }

    Result<bool> dispatch(const Event& event) override {
        for (const auto& listener : _listeners.live(event.type)) {
            auto consumed = listener->onEvent(event);
            if (!consumed) {
                return Err<bool>(std::string("EventLoop::dispatch: ") +
                                 listener->typeName() + " failed", consumed);
            }
            if (*consumed) return Ok(true);
        }
        return Ok(false);
    }

    //=========================================================================
    // Frame timers
    //=========================================================================

    Result<TimerId> addTimer(Timeout intervalMs, EventListener::Ptr listener) override {
        if (intervalMs <= 0) {
            return Err<TimerId>("EventLoop::addTimer: interval must be positive, got " +
                                std::to_string(intervalMs));
        }
        if (!listener) return Err<TimerId>("EventLoop::addTimer: null listener");

        auto timer = std::make_unique<FrameTimer>();
        timer->owner = this;
        timer->id = _nextTimerId;
        timer->intervalMs = intervalMs;
        timer->listener = listener;
        if (int r = uv_timer_init(_loop, &timer->handle); r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        timer->handle.data = timer.get();

        const TimerId id = _nextTimerId++;
        _timers[id] = std::move(timer);
        ydebug("EventLoop::addTimer: id={} interval={}ms", id, intervalMs);
        return Ok(id);
    }

    Result<void> setTimerInterval(TimerId id, Timeout intervalMs) override {
        auto* timer = find(id);
        if (!timer) return Err<void>("EventLoop::setTimerInterval: no timer " + std::to_string(id));
        if (intervalMs <= 0) {
            return Err<void>("EventLoop::setTimerInterval: interval must be positive");
        }
        timer->intervalMs = intervalMs;
        // Takes effect after the next fire
        uv_timer_set_repeat(&timer->handle, static_cast<uint64_t>(intervalMs));
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto* timer = find(id);
        if (!timer) return Err<void>("EventLoop::startTimer: no timer " + std::to_string(id));

        // Loop time is stale while the loop is idle; refresh it so the first
        // fire is a full interval away
        uv_update_time(_loop);
        timer->lastFireNs = uv_hrtime();
        timer->fireCount = 0;
        const auto interval = static_cast<uint64_t>(timer->intervalMs);
        if (int r = uv_timer_start(&timer->handle, onFire, interval, interval); r != 0) {
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        ydebug("EventLoop::startTimer: id={} interval={}ms", id, timer->intervalMs);
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto* timer = find(id);
        if (!timer) return Err<void>("EventLoop::stopTimer: no timer " + std::to_string(id));
        uv_timer_stop(&timer->handle);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("EventLoop::destroyTimer: no timer " + std::to_string(id));
        }
        // Freed by onClosed once libuv lets go of the handle
        FrameTimer* timer = it->second.release();
        _timers.erase(it);
        uv_timer_stop(&timer->handle);
        uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), onClosed);
        _closing++;
        ydebug("EventLoop::destroyTimer: id={} after {} fires", id, timer->fireCount);
        return Ok();
    }

    bool timerActive(TimerId id) const override {
        auto it = _timers.find(id);
        if (it == _timers.end()) return false;
        return uv_is_active(reinterpret_cast<const uv_handle_t*>(&it->second->handle)) != 0;
    }

    size_t closingTimers() const override { return _closing; }

private:
    struct FrameTimer {
        uv_timer_t handle;
        EventLoopImpl* owner = nullptr;
        TimerId id = -1;
        Timeout intervalMs = 0;
        uint64_t lastFireNs = 0;
        uint64_t fireCount = 0;
        std::weak_ptr<EventListener> listener;
    };

    FrameTimer* find(TimerId id) {
        auto it = _timers.find(id);
        return it == _timers.end() ? nullptr : it->second.get();
    }

    static void onFire(uv_timer_t* handle) {
        auto* timer = static_cast<FrameTimer*>(handle->data);
        EventLoopImpl* owner = timer->owner;
        const TimerId id = timer->id;

        const uint64_t now = uv_hrtime();
        const double deltaMs = nsToMs(now - timer->lastFireNs);
        timer->lastFireNs = now;
        timer->fireCount++;

        auto listener = timer->listener.lock();
        if (!listener) {
            ywarn("EventLoop: timer {} lost its listener, stopping", id);
            uv_timer_stop(handle);
            return;
        }

        // The listener may destroy this timer; only touch it again through
        // the owner's table
        auto res = listener->onEvent(Event::timerEvent(id, deltaMs, timer->fireCount));
        if (!res) {
            yerror("EventLoop: timer {} listener failed, stopping: {}", id, error_msg(res));
            if (auto* alive = owner->find(id)) uv_timer_stop(&alive->handle);
        }
    }

    static void onClosed(uv_handle_t* handle) {
        auto* timer = static_cast<FrameTimer*>(handle->data);
        timer->owner->_closing--;
        delete timer;
    }

    uv_loop_t* _loop;
    ListenerTable _listeners;
    std::unordered_map<TimerId, std::unique_ptr<FrameTimer>> _timers;
    TimerId _nextTimerId = 1;
    size_t _closing = 0;
};

Result<EventLoop::Ptr> EventLoop::createImpl() noexcept {
    return Ok(Ptr(new EventLoopImpl()));
}

} // namespace base
} // namespace arcspin
