#include "event_queue.hpp"

EventQueue::EventQueue(NowFn now)
    : now_(std::move(now)) {
    if (!now_) now_ = [] { return Clock::now(); };
}

void EventQueue::set_wake_callback(WakeCallback wake) {
    std::lock_guard lock(mu_);
    wake_ = std::move(wake);
}

void EventQueue::post(Task task) {
    {
        std::lock_guard lock(mu_);
        tasks_.push_back(std::move(task));
    }
    wake();
}

EventQueue::TimerId EventQueue::post_after(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard lock(mu_);
        id = next_id_++;
        auto deadline = now_() + delay;
        timers_.emplace(TimerKey{deadline, id}, std::move(task));
        deadlines_.emplace(id, deadline);
    }
    wake();
    return id;
}

bool EventQueue::cancel(TimerId id) {
    std::lock_guard lock(mu_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return false;
    timers_.erase(TimerKey{it->second, id});
    deadlines_.erase(it);
    return true;
}

size_t EventQueue::run_pending() {
    size_t ran = 0;
    while (auto task = take_ready()) {
        (*task)();
        ++ran;
    }
    return ran;
}

std::optional<std::chrono::milliseconds> EventQueue::time_until_next() const {
    std::lock_guard lock(mu_);
    if (!tasks_.empty()) return std::chrono::milliseconds(0);
    if (timers_.empty()) return std::nullopt;

    auto remaining = timers_.begin()->first.first - now_();
    if (remaining <= Clock::duration::zero()) return std::chrono::milliseconds(0);
    // Round up so the loop never wakes just before the deadline.
    return std::chrono::ceil<std::chrono::milliseconds>(remaining);
}

size_t EventQueue::pending_timers() const {
    std::lock_guard lock(mu_);
    return timers_.size();
}

std::optional<EventQueue::Task> EventQueue::take_ready() {
    std::lock_guard lock(mu_);
    if (!tasks_.empty()) {
        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        return task;
    }

    if (timers_.empty()) return std::nullopt;
    auto it = timers_.begin();
    if (it->first.first > now_()) return std::nullopt;

    auto task = std::move(it->second);
    deadlines_.erase(it->first.second);
    timers_.erase(it);
    return task;
}

void EventQueue::wake() {
    WakeCallback wake;
    {
        std::lock_guard lock(mu_);
        wake = wake_;
    }
    if (wake) wake();
}
