#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

struct MeterSample {
    float rms = 0.0f;
    float db_instant = -120.0f;
    double frame_duration_ms = 0.0;
};

class AudioCapture {
public:
    // Called on the capture thread; implementations must not block.
    using MeterCallback = std::function<void(const MeterSample&)>;

    virtual ~AudioCapture() = default;
    virtual bool request_permission() = 0;
    virtual std::expected<std::filesystem::path, std::string> start_recording() = 0;
    virtual std::expected<std::filesystem::path, std::string> stop_recording() = 0;
    virtual bool is_capturing() const = 0;
    // Seconds of audio in the last finished recording.
    virtual double last_duration() const = 0;
    virtual void set_meter_callback(MeterCallback cb) = 0;
};
