#pragma once

#include <chrono>
#include <mutex>
#include <optional>

// Admits at most one warm-up request in flight and at most one per interval.
class KeepWarmGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit KeepWarmGate(std::chrono::milliseconds min_interval)
        : min_interval_(min_interval) {}

    bool begin(Clock::time_point now) {
        std::lock_guard lock(mu_);
        if (in_flight_) return false;
        if (last_start_ && now - *last_start_ < min_interval_) return false;
        in_flight_ = true;
        last_start_ = now;
        return true;
    }

    void finish() {
        std::lock_guard lock(mu_);
        in_flight_ = false;
    }

private:
    std::mutex mu_;
    std::chrono::milliseconds min_interval_;
    std::optional<Clock::time_point> last_start_;
    bool in_flight_ = false;
};
