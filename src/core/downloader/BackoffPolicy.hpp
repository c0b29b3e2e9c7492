#pragma once

/**
 * BackoffPolicy.hpp
 *
 * Exponential backoff with jitter for retrying failed transfers.
 */

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace courier::core::downloader {

/**
 * Retry timing settings
 */
struct RetryTiming {
    std::chrono::milliseconds baseDelay{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxDelay{60000};
    double jitter{0.2};   // extra delay of up to this fraction of the nominal delay
};

/**
 * BackoffPolicy - delay before the n-th retry
 *
 * delay(n) = min(maxDelay, baseDelay * multiplier^(n-1) * (1 + jitter * u)),
 * u uniform in [0,1). The jitter is clamped to multiplier - 1, so each
 * delay is at least the largest possible previous one and the sequence
 * never decreases.
 */
class BackoffPolicy {
public:
    explicit BackoffPolicy(RetryTiming timing = {});
    BackoffPolicy(RetryTiming timing, uint32_t seed);

    BackoffPolicy(const BackoffPolicy& other);
    BackoffPolicy& operator=(const BackoffPolicy& other);

    /**
     * Build from the "retry.*" section of Config
     */
    static BackoffPolicy fromConfig();

    /**
     * Delay before retry number attempt (1-based)
     */
    std::chrono::milliseconds delayFor(int attempt);

    /**
     * Lower bound of delayFor(attempt), without jitter
     */
    std::chrono::milliseconds nominalDelayFor(int attempt) const;

    const RetryTiming& timing() const { return m_timing; }

private:
    static RetryTiming sanitize(RetryTiming timing);

    RetryTiming m_timing;
    std::mutex m_mutex;
    std::mt19937 m_engine;
};

} // namespace courier::core::downloader
