#include "riskdesk/providers/token_bucket.hpp"
#include <algorithm>

namespace riskdesk {

TokenBucket::TokenBucket(double capacity, double refill_per_minute, const core::Clock& clock)
    : capacity_(std::max(capacity, 0.0)),
      refill_per_second_(std::max(refill_per_minute, 0.0) / 60.0),
      clock_(clock),
      tokens_(std::max(capacity, 0.0)),
      last_refill_(clock.now()) {}

void TokenBucket::refill_unsafe(Timestamp now) const {
    if (now <= last_refill_) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_per_second_);
    last_refill_ = now;
}

bool TokenBucket::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_.now();

    if (now < blocked_until_) {
        return false;
    }

    refill_unsafe(now);
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

void TokenBucket::block_for(std::chrono::seconds cooldown) {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_.now();
    tokens_ = 0.0;
    // Refill restarts from the end of the window, not from now
    blocked_until_ = std::max(blocked_until_, now + cooldown);
    last_refill_ = blocked_until_;
}

bool TokenBucket::is_blocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.now() < blocked_until_;
}

double TokenBucket::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_.now();
    if (now < blocked_until_) {
        return 0.0;
    }
    refill_unsafe(now);
    return tokens_;
}

Timestamp TokenBucket::blocked_until() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_until_;
}

}  // namespace riskdesk
