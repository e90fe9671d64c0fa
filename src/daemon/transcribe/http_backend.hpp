#pragma once

#include "backend.hpp"
#include "keep_warm_gate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <thread>

struct HttpBackendOptions {
    std::string url = "https://api.openai.com";
    std::string api_format = "openai"; // "openai" or "whisper.cpp"
    long timeout_s = 60;
};

// libcurl multipart upload. The openai format streams SSE events back and
// reports partial text; whisper.cpp returns one JSON object.
class HttpBackend : public TranscriptionService {
public:
    static constexpr uintmax_t kMaxUploadBytes = 25 * 1024 * 1024;

    explicit HttpBackend(HttpBackendOptions options);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    std::expected<std::string, TranscribeError>
        transcribe(const TranscriptionRequest& request, const DeltaCallback& on_delta,
                   std::stop_token stop) override;

    void keep_warm() override;

    std::string endpoint() const;

private:
    HttpBackendOptions options_;
    KeepWarmGate warm_gate_{std::chrono::seconds(20)};
    std::jthread warm_thread_;
};

// Pulls a human-readable message out of an error body, if there is one.
std::optional<std::string> parse_error_message(const std::string& body);
