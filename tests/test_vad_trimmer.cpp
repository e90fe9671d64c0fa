#include <catch2/catch_test_macros.hpp>

#include "transcribe/vad_trimmer.hpp"
#include "wav.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// 1 s of silence, 0.5 s of tone, 1 s of silence at 1 kHz.
std::vector<int16_t> padded_speech() {
    std::vector<int16_t> samples(2500, 0);
    for (size_t i = 1000; i < 1500; ++i) {
        samples[i] = (i % 2) ? 8000 : -8000;
    }
    return samples;
}

} // namespace

TEST_CASE("VAD speech bounds", "[vad]") {
    VadTrimmer trimmer(VadTrimmerConfig{.threshold = 0.015f, .padding_seconds = 0.1});

    SECTION("PadsAroundSpeech") {
        auto samples = padded_speech();
        auto bounds = trimmer.speech_bounds(samples, 1000);
        REQUIRE(bounds.has_value());
        REQUIRE(bounds->first == 900);
        REQUIRE(bounds->second == 1600);
    }

    SECTION("AllSilence") {
        std::vector<int16_t> quiet(1000, 100);
        REQUIRE_FALSE(trimmer.speech_bounds(quiet, 1000).has_value());
    }

    SECTION("AlreadyTight") {
        std::vector<int16_t> loud(1000, 10000);
        REQUIRE_FALSE(trimmer.speech_bounds(loud, 1000).has_value());
    }

    SECTION("PaddingClampedAtEdges") {
        std::vector<int16_t> samples(1000, 0);
        samples[20] = 20000;
        auto bounds = trimmer.speech_bounds(samples, 1000);
        REQUIRE(bounds.has_value());
        REQUIRE(bounds->first == 0);
        REQUIRE(bounds->second == 121);
    }
}

TEST_CASE("VAD trim files", "[vad]") {
    VadTrimmer trimmer;
    auto dir = fs::temp_directory_path();
    auto input = dir / ("pt_test_vad_" + std::to_string(::getpid()) + ".wav");
    auto expected_output = dir / ("pt_test_vad_" + std::to_string(::getpid()) + "-trimmed.wav");

    SECTION("WritesTrimmedCopy") {
        REQUIRE(wav::write_file(input, padded_speech(), 1000).has_value());
        auto output = trimmer.trim(input);
        REQUIRE(output.has_value());
        REQUIRE(*output == expected_output);

        auto pcm = wav::read_file(*output);
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->sample_rate == 1000);
        REQUIRE(pcm->samples.size() == 500 + 2 * 80);
        REQUIRE(fs::exists(input));
        fs::remove(*output);
    }

    SECTION("NothingToTrimReturnsInput") {
        std::vector<int16_t> loud(800, 12000);
        REQUIRE(wav::write_file(input, loud, 16000).has_value());
        auto output = trimmer.trim(input);
        REQUIRE(output == std::expected<fs::path, std::string>(input));
        REQUIRE_FALSE(fs::exists(expected_output));
    }

    SECTION("UnreadableInputIsError") {
        auto output = trimmer.trim(dir / "pt_test_vad_missing.wav");
        REQUIRE_FALSE(output.has_value());
        REQUIRE(output.error().starts_with("vad: "));
    }

    fs::remove(input);
}
