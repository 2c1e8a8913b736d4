/**
 * @file correlation.cpp
 * @brief Correlation ID implementation
 */

#include "ragd/ipc/correlation.h"
#include "ragd/common.h"
#include "ragd/logger.h"
#include <sys/random.h>
#include <unistd.h>
#include <uuid/uuid.h>
#include <cerrno>
#include <cstdio>

namespace ragd {

bool system_random(unsigned char* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t n = getrandom(buf + filled, len - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        filled += static_cast<size_t>(n);
    }
    return true;
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

CorrelationGenerator::CorrelationGenerator(RandomSource source)
    : source_(std::move(source)) {
}

std::string CorrelationGenerator::next() {
    unsigned char buf[CORRELATION_ID_BYTES];
    if (source_ && source_(buf, sizeof(buf))) {
        return to_hex(buf, sizeof(buf));
    }
    return fallback();
}

std::string CorrelationGenerator::fallback() {
    fallback_count_.fetch_add(1);
    uint64_t seq = fallback_seq_.fetch_add(1);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        SteadyClock::now().time_since_epoch()).count();

    char buf[CORRELATION_ID_BYTES * 2 + 1];
    std::snprintf(buf, sizeof(buf), "%016llx%08x%08x",
                  static_cast<unsigned long long>(nanos),
                  static_cast<unsigned int>(getpid()),
                  static_cast<unsigned int>(seq & 0xffffffffu));

    LOG_WARN("Correlation", "Random source unavailable, using clock-derived correlation ID");
    return std::string(buf);
}

CorrelationTracker::CorrelationTracker(CorrelationGenerator& generator)
    : generator_(generator) {
}

const std::string& CorrelationTracker::begin() {
    current_ = generator_.next();
    return current_;
}

Error CorrelationTracker::verify(const std::string& actual) const {
    if (current_.empty()) {
        return Error::make(ErrorKind::CORRELATION_MISMATCH, "no request in flight for \"" + actual + "\"");
    }
    if (actual != current_) {
        return Error::make(ErrorKind::CORRELATION_MISMATCH,
                           "correlation id mismatch: expected \"" + current_ + "\", got \"" + actual + "\"");
    }
    return Error::none();
}

std::string new_trace_id() {
    static CorrelationGenerator generator;
    return generator.next();
}

std::string generate_uuid_hex() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    return to_hex(uuid, sizeof(uuid));
}

} // namespace ragd
