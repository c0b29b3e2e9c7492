/**
 * BackoffPolicy.cpp
 *
 * Backoff delay computation.
 */

#include "BackoffPolicy.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <cmath>

namespace courier::core::downloader {

BackoffPolicy::BackoffPolicy(RetryTiming timing)
    : m_timing(sanitize(timing))
    , m_engine(std::random_device{}()) {
}

BackoffPolicy::BackoffPolicy(RetryTiming timing, uint32_t seed)
    : m_timing(sanitize(timing))
    , m_engine(seed) {
}

BackoffPolicy::BackoffPolicy(const BackoffPolicy& other)
    : m_timing(other.m_timing)
    , m_engine(std::random_device{}()) {
}

BackoffPolicy& BackoffPolicy::operator=(const BackoffPolicy& other) {
    if (this != &other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_timing = other.m_timing;
    }
    return *this;
}

BackoffPolicy BackoffPolicy::fromConfig() {
    auto& config = Config::instance();

    RetryTiming timing;
    timing.baseDelay = std::chrono::milliseconds(config.get<int64_t>("retry.baseDelayMs", 1000));
    timing.multiplier = config.get<double>("retry.multiplier", 2.0);
    timing.maxDelay = std::chrono::milliseconds(config.get<int64_t>("retry.maxDelayMs", 60000));
    timing.jitter = config.get<double>("retry.jitter", 0.2);
    return BackoffPolicy(timing);
}

RetryTiming BackoffPolicy::sanitize(RetryTiming timing) {
    if (timing.baseDelay.count() < 0) {
        timing.baseDelay = std::chrono::milliseconds(0);
    }
    if (timing.maxDelay < timing.baseDelay) {
        timing.maxDelay = timing.baseDelay;
    }
    if (timing.multiplier < 1.0) {
        Logger::instance().warn("Retry multiplier {} below 1, using 1", timing.multiplier);
        timing.multiplier = 1.0;
    }
    double maxJitter = timing.multiplier - 1.0;
    if (timing.jitter < 0.0) {
        timing.jitter = 0.0;
    } else if (timing.jitter > maxJitter) {
        Logger::instance().warn("Retry jitter {} exceeds multiplier - 1, clamping to {}",
                                timing.jitter, maxJitter);
        timing.jitter = maxJitter;
    }
    return timing;
}

std::chrono::milliseconds BackoffPolicy::nominalDelayFor(int attempt) const {
    int exponent = std::max(attempt, 1) - 1;
    double cap = static_cast<double>(m_timing.maxDelay.count());
    double nominal = static_cast<double>(m_timing.baseDelay.count())
                     * std::pow(m_timing.multiplier, exponent);
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(nominal, cap)));
}

std::chrono::milliseconds BackoffPolicy::delayFor(int attempt) {
    int exponent = std::max(attempt, 1) - 1;
    double u;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        u = std::uniform_real_distribution<double>(0.0, 1.0)(m_engine);
    }

    double cap = static_cast<double>(m_timing.maxDelay.count());
    double nominal = static_cast<double>(m_timing.baseDelay.count())
                     * std::pow(m_timing.multiplier, exponent);
    double delay = std::min(nominal * (1.0 + m_timing.jitter * u), cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace courier::core::downloader
