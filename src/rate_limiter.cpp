#include "mcphost/rate_limiter.hpp"
#include <algorithm>
#include <cmath>

namespace mcphost {

RateLimiter::RateLimiter(Options opts)
    : opts_(opts) {
}

std::optional<std::chrono::milliseconds> RateLimiter::acquire(const std::string& key) {
    return acquire(key, Clock::now());
}

std::optional<std::chrono::milliseconds> RateLimiter::acquire(const std::string& key,
                                                               Clock::time_point now) {
    if (!enabled()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        if (buckets_.size() >= opts_.max_tracked_keys) prune(now);
        it = buckets_.emplace(key, Bucket{opts_.capacity, now}).first;
    }

    Bucket& b = it->second;
    if (now > b.last) {
        double elapsed = std::chrono::duration<double>(now - b.last).count();
        b.tokens = std::min(opts_.capacity, b.tokens + elapsed * opts_.refill_per_second);
        b.last = now;
    }

    if (b.tokens >= 1.0) {
        b.tokens -= 1.0;
        return std::nullopt;
    }

    if (opts_.refill_per_second <= 0) {
        return std::chrono::milliseconds(60 * 1000);
    }
    double wait_s = (1.0 - b.tokens) / opts_.refill_per_second;
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(wait_s * 1000.0)));
}

void RateLimiter::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(key);
}

// Full buckets carry no state worth keeping.
void RateLimiter::prune(Clock::time_point now) {
    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        double elapsed = std::chrono::duration<double>(now - it->second.last).count();
        if (it->second.tokens + elapsed * opts_.refill_per_second >= opts_.capacity) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mcphost
