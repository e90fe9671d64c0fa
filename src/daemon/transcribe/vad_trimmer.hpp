#pragma once

#include "silence_trimmer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

struct VadTrimmerConfig {
    float threshold = 0.015f;     // normalized amplitude
    double padding_seconds = 0.08;
};

// Cuts leading and trailing silence from a 16-bit WAV by amplitude.
// The trimmed copy is written next to the input as "<stem>-trimmed.wav".
class VadTrimmer : public SilenceTrimmer {
public:
    VadTrimmer() = default;
    explicit VadTrimmer(const VadTrimmerConfig& config) : config_(config) {}

    std::expected<std::filesystem::path, std::string>
        trim(const std::filesystem::path& input) override;

    // Half-open [begin, end) sample range to keep, or nullopt if the input
    // is all silence or already tight.
    std::optional<std::pair<size_t, size_t>>
        speech_bounds(std::span<const int16_t> samples, uint32_t sample_rate) const;

private:
    VadTrimmerConfig config_;
};
