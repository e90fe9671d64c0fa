#include "wav.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr size_t kHeaderSize = 44;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

} // namespace

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(kHeaderSize + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(1);                 // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + kHeaderSize, samples.data(), data_size);
    }

    return out;
}

std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t rate = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = read_u32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || avail < 16) return std::unexpected("truncated fmt chunk");
            format = read_u16(chunk + 8);
            channels = read_u16(chunk + 10);
            rate = read_u32(chunk + 12);
            bits = read_u16(chunk + 22);
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            if (format != 1 || bits != 16 || channels == 0) {
                return std::unexpected("unsupported WAV encoding (need 16-bit PCM)");
            }

            size_t data_len = std::min<size_t>(size, avail);
            size_t frames = data_len / (sizeof(int16_t) * channels);

            Pcm pcm;
            pcm.sample_rate = rate;
            pcm.samples.resize(frames);
            for (size_t i = 0; i < frames; i++) {
                std::memcpy(&pcm.samples[i], bytes.data() + body + i * channels * sizeof(int16_t),
                            sizeof(int16_t));
            }
            return pcm;
        }

        // Chunks are padded to even sizes.
        pos = body + size + (size & 1);
    }

    return std::unexpected("no data chunk");
}

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            uint32_t sample_rate) {
    auto bytes = encode(samples, sample_rate);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string() + " for writing");
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f) {
        // Nobody downstream can use a truncated file.
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return std::unexpected("short write to " + path.string());
    }
    return {};
}

std::expected<Pcm, std::string> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace wav
