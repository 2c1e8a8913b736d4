/**
 * @file correlation.h
 * @brief Correlation ID generation and response matching
 */

#pragma once

#include "ragd/error.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace ragd {

// Number of random bytes per token; tokens are twice as many hex characters
constexpr size_t CORRELATION_ID_BYTES = 16;

/**
 * @brief Fills buf with len random bytes, returning false on failure
 */
using RandomSource = std::function<bool(unsigned char* buf, size_t len)>;

/**
 * @brief Kernel CSPRNG via getrandom(2)
 */
bool system_random(unsigned char* buf, size_t len);

/**
 * @brief Generates fixed-length hex tokens
 *
 * Tokens come from the random source. If it fails, the token is derived
 * from the monotonic clock, the process ID and a per-generator sequence
 * number instead, so a request is never sent unlabeled and two fallback
 * tokens from the same process never collide.
 */
class CorrelationGenerator {
public:
    explicit CorrelationGenerator(RandomSource source = system_random);

    std::string next();

    /**
     * @brief How many tokens were produced by the fallback path
     */
    uint64_t fallback_count() const { return fallback_count_.load(); }

private:
    RandomSource source_;
    std::atomic<uint64_t> fallback_seq_{0};
    std::atomic<uint64_t> fallback_count_{0};

    std::string fallback();
};

/**
 * @brief Holds the token of the in-flight request and checks responses
 */
class CorrelationTracker {
public:
    explicit CorrelationTracker(CorrelationGenerator& generator);

    /**
     * @brief Start a request and return its fresh token
     */
    const std::string& begin();

    /**
     * @brief CORRELATION_MISMATCH unless actual equals the current token
     */
    Error verify(const std::string& actual) const;

    /**
     * @brief Forget the token once the request (or stream) completed
     */
    void finish() { current_.clear(); }

    const std::string& current() const { return current_; }

private:
    CorrelationGenerator& generator_;
    std::string current_;
};

/**
 * @brief Token from the process-wide generator, used for trace IDs
 */
std::string new_trace_id();

/**
 * @brief Random UUID (libuuid) rendered as 32 lowercase hex characters
 */
std::string generate_uuid_hex();

/**
 * @brief Hex-encode bytes (lowercase)
 */
std::string to_hex(const unsigned char* data, size_t len);

} // namespace ragd
