/**
 * @file retry_policy.h
 * @brief Bounded retry of a single frame read on transient errors
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/call_context.h"
#include <functional>
#include <string>
#include <vector>

namespace ragd {

/**
 * @brief Ordered, non-empty list of backoff delays
 *
 * Non-positive delays are dropped; an empty result falls back to the
 * default 250ms, 500ms, 1s schedule.
 */
class RetrySchedule {
public:
    RetrySchedule();
    explicit RetrySchedule(const std::vector<Duration>& delays);

    static RetrySchedule defaults();
    static RetrySchedule from_millis(const std::vector<int>& delays_ms);

    size_t size() const { return delays_.size(); }
    Duration delay(size_t attempt) const { return delays_.at(attempt); }
    const std::vector<Duration>& delays() const { return delays_; }

private:
    std::vector<Duration> delays_;
};

/**
 * @brief Wraps one frame read
 *
 * Only TIMEOUT and UNEXPECTED_EOF are retried. Before retry n the policy
 * sleeps schedule[n], and that sleep is cut short by the call's
 * cancellation or deadline. The request frame is never re-sent; the
 * policy only keeps waiting for a response that has not arrived yet.
 */
class RetryPolicy {
public:
    using ReadOperation = std::function<Result<std::string>()>;

    explicit RetryPolicy(RetrySchedule schedule = RetrySchedule());

    /**
     * @brief Run read until it succeeds, fails fatally, or the schedule is exhausted
     * @param retries_used Set to the number of retries performed
     */
    Result<std::string> run(const CallContext& ctx, const ReadOperation& read,
                            size_t* retries_used = nullptr) const;

    const RetrySchedule& schedule() const { return schedule_; }

private:
    RetrySchedule schedule_;
};

} // namespace ragd
