/**
 * @file call_context.h
 * @brief Deadline and cancellation signal bounding a client call
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace ragd {

/**
 * @brief Deadline plus cancellation flag shared by all copies
 *
 * Copies share the cancellation state, so a caller can hand a copy to the
 * client and cancel it from another thread. Sleeping through sleep_for()
 * wakes up early on cancel() or when the deadline passes.
 */
class CallContext {
public:
    /**
     * @brief Context with no deadline that is never cancelled unless asked
     */
    static CallContext background();

    /**
     * @brief Context whose deadline is now + timeout
     */
    static CallContext with_timeout(Duration timeout);

    /**
     * @brief Context with an absolute deadline
     */
    static CallContext with_deadline(SteadyTimePoint deadline);

    void cancel() const;
    bool cancelled() const;

    std::optional<SteadyTimePoint> deadline() const { return deadline_; }
    bool deadline_exceeded() const;

    /**
     * @brief CANCELLED or DEADLINE_EXCEEDED if the call must stop, none otherwise
     */
    Error err() const;

    /**
     * @brief Sleep for delay unless cancelled or past the deadline first
     * @return none after a full sleep, otherwise the reason it stopped early
     */
    Error sleep_for(Duration delay) const;

    /**
     * @brief How long a single frame read may wait
     *
     * The context deadline when there is one. Otherwise now + idle_timeout,
     * or no limit when idle_timeout is zero.
     */
    SteadyTimePoint frame_deadline(Duration idle_timeout) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    CallContext();

    std::shared_ptr<State> state_;
    std::optional<SteadyTimePoint> deadline_;
};

} // namespace ragd
