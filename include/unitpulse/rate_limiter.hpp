#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>

namespace unitpulse {

// Sliding-window request budget shared by every App Store call in a run.
class RateLimiter {
public:
    using SleepFn = std::function<void(std::chrono::steady_clock::duration)>;

    RateLimiter(int max_requests = 50,
                std::chrono::seconds window = std::chrono::seconds(60),
                SleepFn sleep = nullptr);

    // Blocks until a request may be sent; returns how long it waited.
    std::chrono::steady_clock::duration wait_for_slot();

    // Backoff after a 429, through the same sleep hook.
    void pause(std::chrono::steady_clock::duration d);

    int requests_in_window() const;

private:
    void evict_expired(std::chrono::steady_clock::time_point now);

    int max_requests_;
    std::chrono::seconds window_;
    SleepFn sleep_;
    std::deque<std::chrono::steady_clock::time_point> timestamps_;
    mutable std::mutex mutex_;
};

} // namespace unitpulse
