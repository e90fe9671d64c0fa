#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Records S16LE mono into a ring buffer on PipeWire's loop thread and
// writes the WAV artifact when the recording stops.
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate,
                    std::filesystem::path recording_dir);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool request_permission() override;
    std::expected<std::filesystem::path, std::string> start_recording() override;
    std::expected<std::filesystem::path, std::string> stop_recording() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    double last_duration() const override { return last_duration_; }
    // Must not be changed while capturing.
    void set_meter_callback(MeterCallback cb) override { meter_cb_ = std::move(cb); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    std::filesystem::path recording_dir_;
    std::filesystem::path current_path_;
    uint64_t recording_count_ = 0;
    double last_duration_ = 0.0;
    MeterCallback meter_cb_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
