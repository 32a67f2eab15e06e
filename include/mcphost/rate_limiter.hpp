#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcphost {

/// Token bucket per client key. A capacity of zero disables limiting.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        double capacity = 0;            // burst size
        double refill_per_second = 0;   // sustained rate
        size_t max_tracked_keys = 10000;
    };

    explicit RateLimiter(Options opts);

    /// Take one token for `key`. Returns nullopt when allowed, otherwise
    /// how long until a token is available.
    std::optional<std::chrono::milliseconds> acquire(const std::string& key);

    /// Same, with an explicit time (for deterministic tests).
    std::optional<std::chrono::milliseconds> acquire(const std::string& key, Clock::time_point now);

    [[nodiscard]] bool enabled() const { return opts_.capacity > 0; }

    void forget(const std::string& key);

private:
    struct Bucket {
        double tokens;
        Clock::time_point last;
    };

    void prune(Clock::time_point now);

    Options opts_;
    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace mcphost
