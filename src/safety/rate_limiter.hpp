#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include "core/errors/warden_errors.hpp"

namespace warden::safety {

// Throttle enforcing a minimum gap between consecutive starts. Callers are
// delayed, not rejected, unless the wait would exceed max_wait (0 = never).
class RateLimiter {
public:
    RateLimiter(std::string name, std::chrono::milliseconds min_interval,
                std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));

    // Reserves the next start slot and sleeps until it. Returns the wait.
    core::errors::Result<std::chrono::milliseconds> acquire();

    std::chrono::milliseconds min_interval() const;
    void set_min_interval(std::chrono::milliseconds min_interval);

private:
    std::string name_;
    mutable std::shared_mutex mutex_;
    std::chrono::milliseconds min_interval_;
    std::chrono::milliseconds max_wait_;
    std::optional<std::chrono::steady_clock::time_point> last_start_;
};

}  // namespace warden::safety
