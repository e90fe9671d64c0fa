#pragma once

#include <chrono>
#include <optional>
#include <string>

// Rate-limits live transcript previews and drops repeats.
class PreviewThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit PreviewThrottle(std::chrono::milliseconds interval = std::chrono::milliseconds(250))
        : interval_(interval) {}

    bool admit(const std::string& text, Clock::time_point now) {
        if (text == last_text_) return false;
        if (last_shown_ && now - *last_shown_ < interval_) return false;
        last_text_ = text;
        last_shown_ = now;
        return true;
    }

    void reset() {
        last_text_.clear();
        last_shown_.reset();
    }

private:
    std::chrono::milliseconds interval_;
    std::string last_text_;
    std::optional<Clock::time_point> last_shown_;
};
