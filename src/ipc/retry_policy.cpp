/**
 * @file retry_policy.cpp
 * @brief Retry policy implementation
 */

#include "ragd/ipc/retry_policy.h"
#include "ragd/logger.h"

namespace ragd {

namespace {

std::vector<Duration> default_delays() {
    return {Duration(250), Duration(500), Duration(1000)};
}

}  // namespace

RetrySchedule::RetrySchedule()
    : delays_(default_delays()) {
}

RetrySchedule::RetrySchedule(const std::vector<Duration>& delays) {
    for (const auto& delay : delays) {
        if (delay.count() > 0) {
            delays_.push_back(delay);
        }
    }
    if (delays_.empty()) {
        delays_ = default_delays();
    }
}

RetrySchedule RetrySchedule::defaults() {
    return RetrySchedule();
}

RetrySchedule RetrySchedule::from_millis(const std::vector<int>& delays_ms) {
    std::vector<Duration> delays;
    delays.reserve(delays_ms.size());
    for (int ms : delays_ms) {
        delays.emplace_back(ms);
    }
    return RetrySchedule(delays);
}

RetryPolicy::RetryPolicy(RetrySchedule schedule)
    : schedule_(std::move(schedule)) {
}

Result<std::string> RetryPolicy::run(const CallContext& ctx, const ReadOperation& read,
                                     size_t* retries_used) const {
    size_t attempt = 0;
    while (true) {
        if (retries_used) {
            *retries_used = attempt;
        }

        auto result = read();
        if (result.ok()) {
            return result;
        }
        if (!result.error.retryable() || attempt >= schedule_.size()) {
            if (result.error.retryable()) {
                LOG_ERROR("RetryPolicy", "Retries exhausted after " + std::to_string(attempt) +
                          " attempts: " + result.error.to_string());
            }
            return result;
        }

        Duration delay = schedule_.delay(attempt);
        ++attempt;
        LOG_WARN("RetryPolicy", "Frame read failed (" + result.error.to_string() + "), retry " +
                 std::to_string(attempt) + " in " + std::to_string(delay.count()) + "ms");

        Error stopped = ctx.sleep_for(delay);
        if (!stopped.ok()) {
            return Result<std::string>::failure(stopped);
        }
    }
}

} // namespace ragd
