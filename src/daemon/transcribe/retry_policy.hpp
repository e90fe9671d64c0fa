#pragma once

#include "errors.hpp"

#include <chrono>

// Classifies transcription failures and computes backoff. Never sleeps;
// the caller enforces max_attempts.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::nanoseconds initial_delay = std::chrono::milliseconds(400);

    bool should_retry(const TranscribeError& err) const;
    std::chrono::nanoseconds next_delay(std::chrono::nanoseconds previous) const;
};
