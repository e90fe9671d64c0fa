#include "coordinator.hpp"

#include <condition_variable>
#include <mutex>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Removes the recording and any trimmed copy, whichever way we leave.
struct ArtifactCleanup {
    fs::path source;
    std::optional<fs::path> trimmed;

    ~ArtifactCleanup() {
        std::error_code ec;
        fs::remove(source, ec);
        if (trimmed) fs::remove(*trimmed, ec);
    }
};

bool file_ready(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return !ec && size > TranscriptionCoordinator::kMinReadyBytes;
}

} // namespace

TranscriptionCoordinator::TranscriptionCoordinator(TranscriptionService& service,
                                                   SilenceTrimmer& trimmer,
                                                   RetryPolicy policy)
    : service_(service), trimmer_(trimmer), policy_(policy) {}

std::expected<std::string, TranscribeError>
TranscriptionCoordinator::transcribe(const fs::path& source, double recorded_seconds,
                                     const TranscriptionRequestOptions& options,
                                     const std::string& api_key,
                                     const TranscriptionService::DeltaCallback& on_delta,
                                     std::stop_token stop) {
    ArtifactCleanup cleanup{.source = source, .trimmed = std::nullopt};

    if (!file_ready(source)) {
        return std::unexpected(transcribe_error::AudioFileNotReady{});
    }

    fs::path upload = source;
    if (options.enable_vad_trim && recorded_seconds >= kMinTrimSeconds) {
        auto trimmed = trimmer_.trim(source);
        if (!trimmed) {
            return std::unexpected(transcribe_error::TrimFailed{trimmed.error()});
        }
        if (*trimmed != source) {
            upload = *trimmed;
            cleanup.trimmed = *trimmed;
        }
    }

    TranscriptionRequest request{
        .file = upload,
        .model = options.model,
        .prompt = options.prompt,
        .language = options.language,
        .api_key = api_key,
    };

    auto delay = policy_.initial_delay;
    for (int attempt = 1;; ++attempt) {
        if (stop.stop_requested()) {
            return std::unexpected(transcribe_error::Cancelled{});
        }

        auto result = service_.transcribe(request, on_delta, stop);
        if (result) return result;

        if (stop.stop_requested() || is_cancelled(result.error())) {
            return std::unexpected(transcribe_error::Cancelled{});
        }
        if (attempt >= policy_.max_attempts || !policy_.should_retry(result.error())) {
            return result;
        }

        std::println(stderr, "transcribe: attempt {} failed ({}), retrying",
                     attempt, describe(result.error()));
        if (!wait_backoff(delay, stop)) {
            return std::unexpected(transcribe_error::Cancelled{});
        }
        delay = policy_.next_delay(delay);
    }
}

bool TranscriptionCoordinator::wait_backoff(std::chrono::nanoseconds delay, std::stop_token stop) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock lock(mu);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}
