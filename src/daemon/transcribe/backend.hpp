#pragma once

#include "errors.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

struct TranscriptionRequest {
    std::filesystem::path file;
    std::string model;
    std::optional<std::string> prompt;
    std::optional<std::string> language;
    std::string api_key;
};

// Remote speech-to-text. transcribe() blocks the calling worker thread and
// must return transcribe_error::Cancelled promptly once stop is requested.
class TranscriptionService {
public:
    // Receives the aggregate text so far, in order.
    using DeltaCallback = std::function<void(const std::string&)>;

    virtual ~TranscriptionService() = default;

    virtual std::expected<std::string, TranscribeError>
        transcribe(const TranscriptionRequest& request, const DeltaCallback& on_delta,
                   std::stop_token stop) = 0;

    // Non-blocking hint that a request is about to follow.
    virtual void keep_warm() = 0;
};
