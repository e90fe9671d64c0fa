#pragma once

#include "backend.hpp"
#include "retry_policy.hpp"
#include "silence_trimmer.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

struct TranscriptionRequestOptions {
    bool enable_vad_trim = false;
    std::string model;
    std::optional<std::string> prompt;
    std::optional<std::string> language;
};

// Runs one recording through trim -> upload -> retry. Owns the source file
// from the moment transcribe() is called: it is removed on every exit path.
// Safe to call from a worker thread; holds no per-call state.
class TranscriptionCoordinator {
public:
    static constexpr uintmax_t kMinReadyBytes = 1024;
    static constexpr double kMinTrimSeconds = 1.2;

    TranscriptionCoordinator(TranscriptionService& service, SilenceTrimmer& trimmer,
                             RetryPolicy policy);

    std::expected<std::string, TranscribeError>
        transcribe(const std::filesystem::path& source, double recorded_seconds,
                   const TranscriptionRequestOptions& options, const std::string& api_key,
                   const TranscriptionService::DeltaCallback& on_delta,
                   std::stop_token stop);

    const RetryPolicy& policy() const { return policy_; }

private:
    // False if stop was requested before the delay elapsed.
    static bool wait_backoff(std::chrono::nanoseconds delay, std::stop_token stop);

    TranscriptionService& service_;
    SilenceTrimmer& trimmer_;
    RetryPolicy policy_;
};
