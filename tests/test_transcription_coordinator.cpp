#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "transcribe/coordinator.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
namespace te = transcribe_error;

namespace {

RetryPolicy fast_policy(int attempts = 3) {
    return RetryPolicy{.max_attempts = attempts, .initial_delay = 1ms};
}

TranscriptionRequestOptions options(bool trim = false) {
    return TranscriptionRequestOptions{
        .enable_vad_trim = trim,
        .model = "gpt-4o-mini-transcribe",
        .prompt = std::nullopt,
        .language = std::optional<std::string>("en"),
    };
}

} // namespace

TEST_CASE("Transcription coordinator", "[coordinator]") {
    FakeTranscriber service;
    FakeTrimmer trimmer;
    TranscriptionCoordinator coordinator(service, trimmer, fast_policy());
    std::stop_source stop;

    SECTION("SuccessRemovesSource") {
        auto audio = write_fake_audio("ok", 4096);
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(result == std::expected<std::string, TranscribeError>("hello world"));
        REQUIRE_FALSE(fs::exists(audio));

        auto requests = service.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].file == audio);
        REQUIRE(requests[0].model == "gpt-4o-mini-transcribe");
        REQUIRE(requests[0].language == std::optional<std::string>("en"));
        REQUIRE(requests[0].api_key == "sk");
    }

    SECTION("TinyFileNotReady") {
        auto audio = write_fake_audio("tiny", 1024);
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == TranscribeError{te::AudioFileNotReady{}});
        REQUIRE(service.calls() == 0);
        REQUIRE_FALSE(fs::exists(audio));
    }

    SECTION("MissingFileNotReady") {
        auto result = coordinator.transcribe("/tmp/pt_test_missing.wav", 2.0, options(), "sk",
                                             {}, stop.get_token());
        REQUIRE(result.error() == TranscribeError{te::AudioFileNotReady{}});
    }

    SECTION("TrimSkippedForShortRecording") {
        auto audio = write_fake_audio("short", 4096);
        auto result = coordinator.transcribe(audio, 1.1, options(true), "sk", {}, stop.get_token());
        REQUIRE(result.has_value());
        REQUIRE(trimmer.calls == 0);
    }

    SECTION("TrimmedFileUploadedAndRemoved") {
        auto audio = write_fake_audio("long", 4096);
        trimmer.output = fs::temp_directory_path() / "pt_test_long-trimmed.wav";
        auto result = coordinator.transcribe(audio, 1.2, options(true), "sk", {}, stop.get_token());
        REQUIRE(result.has_value());
        REQUIRE(trimmer.calls == 1);
        REQUIRE(service.requests()[0].file == trimmer.output);
        REQUIRE_FALSE(fs::exists(audio));
        REQUIRE_FALSE(fs::exists(trimmer.output));
    }

    SECTION("TrimFailureSurfaced") {
        auto audio = write_fake_audio("trimfail", 4096);
        trimmer.fail = true;
        auto result = coordinator.transcribe(audio, 5.0, options(true), "sk", {}, stop.get_token());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(std::holds_alternative<te::TrimFailed>(result.error()));
        REQUIRE(service.calls() == 0);
        REQUIRE_FALSE(fs::exists(audio));
    }

    SECTION("TransientErrorsRetried") {
        auto audio = write_fake_audio("retry", 4096);
        service.script(std::unexpected(te::Timeout{}));
        service.script(std::unexpected(te::Server{503, "busy"}));
        service.script(std::string("third time"));
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(result == std::expected<std::string, TranscribeError>("third time"));
        REQUIRE(service.calls() == 3);
    }

    SECTION("AttemptsBounded") {
        auto audio = write_fake_audio("bounded", 4096);
        for (int i = 0; i < 5; ++i) service.script(std::unexpected(te::Network{"reset"}));
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(result.error() == TranscribeError{te::Network{"reset"}});
        REQUIRE(service.calls() == 3);
    }

    SECTION("PermanentErrorNotRetried") {
        auto audio = write_fake_audio("perm", 4096);
        service.script(std::unexpected(te::Unauthorized{}));
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(result.error() == TranscribeError{te::Unauthorized{}});
        REQUIRE(service.calls() == 1);
    }

    SECTION("StopBeforeCallCancels") {
        auto audio = write_fake_audio("stopped", 4096);
        stop.request_stop();
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(is_cancelled(result.error()));
        REQUIRE(service.calls() == 0);
        REQUIRE_FALSE(fs::exists(audio));
    }

    SECTION("StopDuringBackoffCancels") {
        TranscriptionCoordinator slow(service, trimmer,
                                      RetryPolicy{.max_attempts = 3, .initial_delay = 10s});
        auto audio = write_fake_audio("backoff", 4096);
        service.script(std::unexpected(te::Timeout{}));

        std::jthread canceller([&stop, &service] {
            while (service.returned() < 1) std::this_thread::sleep_for(1ms);
            std::this_thread::sleep_for(5ms);
            stop.request_stop();
        });

        auto started = std::chrono::steady_clock::now();
        auto result = slow.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(is_cancelled(result.error()));
        REQUIRE(std::chrono::steady_clock::now() - started < 5s);
        REQUIRE(service.calls() == 1);
    }

    SECTION("StopDuringCallCancels") {
        auto audio = write_fake_audio("inflight", 4096);
        service.hold_next(true);

        std::jthread canceller([&stop, &service] {
            while (service.calls() < 1) std::this_thread::sleep_for(1ms);
            stop.request_stop();
        });

        auto result = coordinator.transcribe(audio, 2.0, options(), "sk", {}, stop.get_token());
        REQUIRE(is_cancelled(result.error()));
        REQUIRE_FALSE(fs::exists(audio));
    }

    SECTION("DeltasForwarded") {
        auto audio = write_fake_audio("deltas", 4096);
        service.deltas = {"hel", "hello"};
        std::vector<std::string> seen;
        auto result = coordinator.transcribe(audio, 2.0, options(), "sk",
                                             [&seen](const std::string& t) { seen.push_back(t); },
                                             stop.get_token());
        REQUIRE(result.has_value());
        REQUIRE(seen == std::vector<std::string>{"hel", "hello"});
    }
}
