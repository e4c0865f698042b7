#pragma once

#include "object.h"
#include "event.h"
#include <arcspin/result.hpp>
#include <functional>

namespace arcspin {
namespace base {

class EventListener : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventListener>;

    ~EventListener() override = default;

    // Ok(true) consumes the event, Ok(false) passes it on, Err aborts dispatch
    virtual Result<bool> onEvent(const Event& event) = 0;
};

//=============================================================================
// CallbackListener - EventListener around a callable
//
// The loop only keeps weak references, so the caller holds the returned Ptr
// for as long as the callback should stay subscribed.
//=============================================================================
class CallbackListener final : public EventListener {
public:
    using Callback = std::function<Result<bool>(const Event&)>;

    static std::shared_ptr<CallbackListener> create(Callback callback) {
        return std::shared_ptr<CallbackListener>(new CallbackListener(std::move(callback)));
    }

    const char* typeName() const override { return "CallbackListener"; }

    Result<bool> onEvent(const Event& event) override {
        if (!_callback) return Ok(false);
        return _callback(event);
    }

private:
    explicit CallbackListener(Callback callback) : _callback(std::move(callback)) {}

    Callback _callback;
};

} // namespace base
} // namespace arcspin
