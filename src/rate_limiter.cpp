#include "unitpulse/rate_limiter.hpp"
#include <thread>

namespace unitpulse {

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window, SleepFn sleep)
    : max_requests_(max_requests), window_(window), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::steady_clock::duration d) { std::this_thread::sleep_for(d); };
    }
}

void RateLimiter::evict_expired(std::chrono::steady_clock::time_point now) {
    while (!timestamps_.empty() && (now - timestamps_.front()) > window_) {
        timestamps_.pop_front();
    }
}

std::chrono::steady_clock::duration RateLimiter::wait_for_slot() {
    std::unique_lock lock(mutex_);
    auto start = std::chrono::steady_clock::now();
    auto now = start;
    evict_expired(now);

    while (static_cast<int>(timestamps_.size()) >= max_requests_) {
        auto sleep_duration = (timestamps_.front() + window_) - now;
        if (sleep_duration.count() > 0) {
            lock.unlock();
            sleep_(sleep_duration);
            lock.lock();
        }
        now = std::chrono::steady_clock::now();
        evict_expired(now);

        // Injected sleeps may not advance the clock; give up the oldest slot.
        if (static_cast<int>(timestamps_.size()) >= max_requests_ &&
            sleep_duration.count() > 0) {
            timestamps_.pop_front();
        }
    }

    timestamps_.push_back(now);
    return now - start;
}

void RateLimiter::pause(std::chrono::steady_clock::duration d) {
    sleep_(d);
}

int RateLimiter::requests_in_window() const {
    std::lock_guard lock(mutex_);
    return static_cast<int>(timestamps_.size());
}

} // namespace unitpulse
