#include <arcspin/frame-driver.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

namespace arcspin {

//=============================================================================
// FrameDriverImpl - private implementation
//=============================================================================

class FrameDriverImpl : public FrameDriver {
public:
    FrameDriverImpl() : _interpolator(std::make_shared<LinearInterpolator>()) {}

    void setListener(Listener listener) override { _listener = std::move(listener); }

    Result<void> start() override {
        _generation++;
        _running = true;
        _elapsed = 0.0;
        _repeatCount = 0;
        ydebug("FrameDriver::start: duration={}ms", _duration);
        if (_listener.onStart) _listener.onStart();
        return notifyUpdate();
    }

    void cancel() override {
        if (!_running) return;
        _generation++;
        _running = false;
        ydebug("FrameDriver::cancel: elapsed={}ms", _elapsed);
        if (_listener.onCancel) _listener.onCancel();
    }

    Result<void> advance(double deltaMs) override {
        if (!_running) return Ok();
        if (!std::isfinite(deltaMs)) {
            return Err<void>("FrameDriver::advance: non-finite delta");
        }
        if (deltaMs < 0.0) {
            return Err<void>("FrameDriver::advance: negative delta " + std::to_string(deltaMs));
        }

        _elapsed += deltaMs;

        const double duration = static_cast<double>(_duration);
        if (_elapsed < duration) return notifyUpdate();

        // Fold every crossed boundary at once; only the first
        // MAX_REPEATS_PER_ADVANCE of them reach the repeat listener.
        const double cycles = std::floor(_elapsed / duration);
        _elapsed = std::fmod(_elapsed, duration);
        const double notified = std::min(cycles, static_cast<double>(MAX_REPEATS_PER_ADVANCE));
        if (cycles > notified) {
            ywarn("FrameDriver::advance: {} cycles in one delta, skipping {}",
                  cycles, cycles - notified);
            addRepeats(cycles - notified);
        }

        const uint64_t generation = _generation;
        for (int i = 0; i < static_cast<int>(notified); ++i) {
            addRepeats(1.0);
            if (_listener.onRepeat) {
                if (auto res = _listener.onRepeat(); !res) {
                    return Err<void>("FrameDriver: repeat listener failed", res);
                }
            }
            // Restarted or cancelled from inside the repeat listener
            if (generation != _generation || !_running) return Ok();
        }

        return notifyUpdate();
    }

    Result<void> setDuration(int durationMs) override {
        if (durationMs <= 0) {
            return Err<void>("FrameDriver::setDuration: duration must be positive, got " +
                             std::to_string(durationMs));
        }
        _duration = durationMs;
        _elapsed = std::min(_elapsed, static_cast<double>(_duration));
        return Ok();
    }

    void setInterpolator(Interpolator::Ptr interpolator) override {
        _interpolator = interpolator ? std::move(interpolator)
                                     : std::make_shared<LinearInterpolator>();
    }

    bool isRunning() const override { return _running; }
    int durationMs() const override { return _duration; }
    double elapsedMs() const override { return _elapsed; }
    uint32_t repeatCount() const override { return _repeatCount; }

    float fraction() const override {
        float linear = static_cast<float>(_elapsed / static_cast<double>(_duration));
        return _interpolator->interpolation(std::clamp(linear, 0.0f, 1.0f));
    }

private:
    void addRepeats(double count) {
        const double total = static_cast<double>(_repeatCount) + count;
        _repeatCount = total >= static_cast<double>(UINT32_MAX)
            ? UINT32_MAX : static_cast<uint32_t>(total);
    }

    Result<void> notifyUpdate() {
        if (!_listener.onUpdate) return Ok();
        if (auto res = _listener.onUpdate(fraction()); !res) {
            return Err<void>("FrameDriver: update listener failed", res);
        }
        return Ok();
    }

    Listener _listener;
    Interpolator::Ptr _interpolator;

    double _elapsed = 0.0;
    int _duration = 1000;
    uint32_t _repeatCount = 0;
    uint64_t _generation = 0;
    bool _running = false;
};

//=============================================================================
// Factory
//=============================================================================

Result<FrameDriver::Ptr> FrameDriver::createImpl(int durationMs) {
    auto impl = std::shared_ptr<FrameDriverImpl>(new FrameDriverImpl());
    if (auto res = impl->setDuration(durationMs); !res) {
        return Err<Ptr>("Failed to create FrameDriver", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace arcspin
