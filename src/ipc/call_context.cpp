/**
 * @file call_context.cpp
 * @brief CallContext implementation
 */

#include "ragd/ipc/call_context.h"

namespace ragd {

CallContext::CallContext()
    : state_(std::make_shared<State>()) {
}

CallContext CallContext::background() {
    return CallContext();
}

CallContext CallContext::with_timeout(Duration timeout) {
    return with_deadline(SteadyClock::now() + timeout);
}

CallContext CallContext::with_deadline(SteadyTimePoint deadline) {
    CallContext ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

void CallContext::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CallContext::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CallContext::deadline_exceeded() const {
    return deadline_ && SteadyClock::now() >= *deadline_;
}

Error CallContext::err() const {
    if (cancelled()) {
        return Error::make(ErrorKind::CANCELLED, "call cancelled");
    }
    if (deadline_exceeded()) {
        return Error::make(ErrorKind::DEADLINE_EXCEEDED, "call deadline exceeded");
    }
    return Error::none();
}

Error CallContext::sleep_for(Duration delay) const {
    if (delay.count() <= 0) {
        return err();
    }

    auto wake_at = SteadyClock::now() + delay;
    bool cut_short = false;
    if (deadline_ && *deadline_ < wake_at) {
        wake_at = *deadline_;
        cut_short = true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, wake_at, [this] { return state_->cancelled; });
    if (state_->cancelled) {
        return Error::make(ErrorKind::CANCELLED, "call cancelled");
    }
    if (cut_short) {
        return Error::make(ErrorKind::DEADLINE_EXCEEDED, "call deadline exceeded");
    }
    return Error::none();
}

SteadyTimePoint CallContext::frame_deadline(Duration idle_timeout) const {
    if (deadline_) {
        return *deadline_;
    }
    if (idle_timeout.count() <= 0) {
        return SteadyTimePoint::max();
    }
    return SteadyClock::now() + idle_timeout;
}

} // namespace ragd
