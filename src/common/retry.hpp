#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace sightlink {

// ============================================================================
// Retry Policy Configuration
// ============================================================================

struct RetryPolicy {
    // Maximum number of retry attempts (0 = infinite)
    uint32_t max_attempts{10};

    // Delay before the first retry
    std::chrono::milliseconds initial_delay{2000};

    // Maximum delay between retries
    std::chrono::milliseconds max_delay{60000};

    // Multiplier for exponential backoff
    double multiplier{2.0};

    // Add randomness to avoid thundering herd (0.0 to 1.0)
    double jitter{0.0};

    // Gateway reconnect: 2s, 4s, 8s ... capped at 60s, 10 attempts
    static RetryPolicy gateway_reconnect() {
        return {10, std::chrono::milliseconds(2000), std::chrono::milliseconds(60000), 2.0, 0.0};
    }

    static RetryPolicy infinite() {
        return {0, std::chrono::milliseconds(1000), std::chrono::milliseconds(60000), 2.0, 0.1};
    }
};

// ============================================================================
// Retry State
// ============================================================================
// delay(n) = initial_delay * multiplier^(n-1), capped at max_delay,
// where n is the 1-based attempt number returned by attempt().
class RetryState {
public:
    explicit RetryState(const RetryPolicy& policy = RetryPolicy::gateway_reconnect())
        : policy_(policy) {}

    // Reset state for new operation
    void reset() { attempt_ = 0; }

    // Whether another attempt is allowed
    bool should_retry() const {
        return policy_.max_attempts == 0 || attempt_ < policy_.max_attempts;
    }

    bool exhausted() const { return !should_retry(); }

    // Attempts consumed so far
    uint32_t attempt() const { return attempt_; }

    const RetryPolicy& policy() const { return policy_; }

    // Delay for the given 1-based attempt, without jitter
    std::chrono::milliseconds delay_for(uint32_t attempt) const {
        double delay = static_cast<double>(policy_.initial_delay.count());
        for (uint32_t i = 1; i < attempt; ++i) {
            delay *= policy_.multiplier;
            if (delay >= static_cast<double>(policy_.max_delay.count())) break;
        }
        auto capped = std::min(delay, static_cast<double>(policy_.max_delay.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(capped));
    }

    // Consume one attempt and return its delay
    std::chrono::milliseconds next_delay() {
        ++attempt_;
        auto delay = delay_for(attempt_);

        if (policy_.jitter > 0) {
            static thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(1.0 - policy_.jitter, 1.0 + policy_.jitter);
            delay = std::chrono::milliseconds(static_cast<int64_t>(delay.count() * dist(rng)));
        }
        return delay;
    }

private:
    RetryPolicy policy_;
    uint32_t attempt_{0};
};

} // namespace sightlink
