#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

// 16-bit PCM mono WAV, the only format the daemon records or uploads.
namespace wav {

struct Pcm {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate);

// Multi-channel input keeps only the first channel.
std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes);

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            uint32_t sample_rate);
std::expected<Pcm, std::string> read_file(const std::filesystem::path& path);

} // namespace wav
