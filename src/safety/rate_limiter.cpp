#include "safety/rate_limiter.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::safety {

using core::errors::ErrorKind;
using core::errors::WardenError;

RateLimiter::RateLimiter(std::string name, const std::chrono::milliseconds min_interval,
                         const std::chrono::milliseconds max_wait)
    : name_(std::move(name)), min_interval_(min_interval), max_wait_(max_wait) {}

core::errors::Result<std::chrono::milliseconds> RateLimiter::acquire() {
    std::chrono::steady_clock::time_point slot;
    std::chrono::milliseconds wait(0);
    {
        // Only the reservation is serialized; the sleep happens unlocked.
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        slot = now;
        if (last_start_.has_value()) {
            slot = std::max(now, last_start_.value() + min_interval_);
        }
        wait = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
        if (max_wait_.count() > 0 && wait > max_wait_) {
            return WardenError{ErrorKind::RateLimited,
                               name_ + " rate limit would delay start by " +
                                   std::to_string(wait.count()) + " ms (max " +
                                   std::to_string(max_wait_.count()) + " ms)",
                               "Retry later."};
        }
        last_start_ = slot;
    }

    if (slot > std::chrono::steady_clock::now()) {
        LOG_DEBUG("RateLimiter: " + name_ + " throttled for " +
                  std::to_string(wait.count()) + " ms");
        std::this_thread::sleep_until(slot);
    }
    return wait;
}

std::chrono::milliseconds RateLimiter::min_interval() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return min_interval_;
}

void RateLimiter::set_min_interval(const std::chrono::milliseconds min_interval) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    min_interval_ = min_interval;
}

}  // namespace warden::safety
