// include/riskdesk/providers/token_bucket.hpp
#pragma once

#include <chrono>
#include <mutex>
#include "riskdesk/core/time_utils.hpp"

namespace riskdesk {

/**
 * @class TokenBucket
 * @brief Thread-safe call budget for one provider
 *
 * Tokens refill continuously at refill_per_minute up to capacity. A quota
 * signal from the server drains the bucket and blocks it until the cooldown
 * ends, regardless of refill.
 */
class TokenBucket {
public:
    TokenBucket(double capacity, double refill_per_minute, const core::Clock& clock);

    /**
     * @brief Take one token if available
     * @return false when the bucket is empty or blocked
     */
    bool try_acquire();

    /**
     * @brief Drain the bucket and refuse calls for a cooldown window
     */
    void block_for(std::chrono::seconds cooldown);

    bool is_blocked() const;

    double available() const;

    Timestamp blocked_until() const;

private:
    void refill_unsafe(Timestamp now) const;

    const double capacity_;
    const double refill_per_second_;
    const core::Clock& clock_;

    mutable std::mutex mutex_;
    mutable double tokens_;
    mutable Timestamp last_refill_;
    Timestamp blocked_until_{};
};

}  // namespace riskdesk
