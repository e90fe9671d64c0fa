#include "vad_trimmer.hpp"

#include "../wav.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace {

float normalized(int16_t s) {
    return static_cast<float>(std::abs(static_cast<int>(s))) /
           static_cast<float>(std::numeric_limits<int16_t>::max());
}

} // namespace

std::optional<std::pair<size_t, size_t>>
VadTrimmer::speech_bounds(std::span<const int16_t> samples, uint32_t sample_rate) const {
    auto loud = [this](int16_t s) { return normalized(s) > config_.threshold; };

    auto first = std::ranges::find_if(samples, loud);
    if (first == samples.end()) return std::nullopt;
    auto last = std::find_if(samples.rbegin(), samples.rend(), loud);

    size_t speech_start = static_cast<size_t>(first - samples.begin());
    size_t speech_end = samples.size() - static_cast<size_t>(last - samples.rbegin());

    auto padding = static_cast<size_t>(sample_rate * config_.padding_seconds);
    size_t begin = speech_start > padding ? speech_start - padding : 0;
    size_t end = std::min(samples.size(), speech_end + padding);

    if (begin == 0 && end == samples.size()) return std::nullopt;
    return std::pair{begin, end};
}

std::expected<std::filesystem::path, std::string>
VadTrimmer::trim(const std::filesystem::path& input) {
    auto pcm = wav::read_file(input);
    if (!pcm) {
        return std::unexpected("vad: " + pcm.error());
    }
    if (pcm->samples.empty()) return input;

    auto bounds = speech_bounds(pcm->samples, pcm->sample_rate);
    if (!bounds) return input;

    auto output = input.parent_path() / (input.stem().string() + "-trimmed.wav");
    std::span<const int16_t> kept(pcm->samples.data() + bounds->first,
                                  bounds->second - bounds->first);
    auto written = wav::write_file(output, kept, pcm->sample_rate);
    if (!written) {
        return std::unexpected("vad: " + written.error());
    }
    return output;
}
