#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

// Marshals work onto the daemon's owner thread. post()/post_after() are safe
// from any thread; run_pending() must only be called by the owner.
class EventQueue {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using WakeCallback = std::function<void()>;

    explicit EventQueue(NowFn now = {});

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Invoked after every post so a sleeping loop can pick the task up.
    void set_wake_callback(WakeCallback wake);

    void post(Task task);
    TimerId post_after(std::chrono::milliseconds delay, Task task);
    // Returns false if the timer already ran or never existed.
    bool cancel(TimerId id);

    // Runs posted tasks, then due timers in deadline order, until nothing
    // is ready. Returns the number of tasks run.
    size_t run_pending();

    // Time until the earliest timer is due, zero if work is ready now,
    // nullopt if the queue is idle.
    std::optional<std::chrono::milliseconds> time_until_next() const;

    size_t pending_timers() const;

private:
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    std::optional<Task> take_ready();
    void wake();

    NowFn now_;
    WakeCallback wake_;

    mutable std::mutex mu_;
    std::deque<Task> tasks_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
};
