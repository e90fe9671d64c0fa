#include "platform/linux/pipewire_capture.hpp"

#include "wav.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace {

MeterSample measure(std::span<const int16_t> samples, uint32_t sample_rate) {
    double sum = 0.0;
    for (int16_t s : samples) {
        double v = s / 32768.0;
        sum += v * v;
    }
    float rms = samples.empty() ? 0.0f : static_cast<float>(std::sqrt(sum / samples.size()));
    float db = rms > 0.0f ? 20.0f * std::log10(rms) : -120.0f;
    return MeterSample{
        .rms = rms,
        .db_instant = std::max(db, -120.0f),
        .frame_duration_ms = 1000.0 * samples.size() / sample_rate,
    };
}

} // namespace

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate,
                                 fs::path recording_dir)
    : ring_buf_(ring_buf), sample_rate_(sample_rate),
      recording_dir_(std::move(recording_dir)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    teardown();
    if (!current_path_.empty()) {
        std::error_code ec;
        fs::remove(current_path_, ec);
    }
    pw_deinit();
}

bool PipeWireCapture::request_permission() {
    auto* loop = pw_loop_new(nullptr);
    if (!loop) return false;

    bool ok = false;
    if (auto* context = pw_context_new(loop, nullptr, 0)) {
        if (auto* core = pw_context_connect(context, nullptr, 0)) {
            ok = true;
            pw_core_disconnect(core);
        } else {
            std::println(stderr, "audio: cannot connect to PipeWire");
        }
        pw_context_destroy(context);
    }
    pw_loop_destroy(loop);
    return ok;
}

std::expected<fs::path, std::string> PipeWireCapture::start_recording() {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("already capturing");
    }

    std::error_code ec;
    fs::create_directories(recording_dir_, ec);
    current_path_ = recording_dir_ /
        std::format("presstalk-{}-{}.wav", ::getpid(), ++recording_count_);

    loop_ = pw_thread_loop_new("presstalk", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "presstalk",
        PW_KEY_APP_NAME, "presstalk",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "presstalk-capture",
        props,
        &stream_events_,
        this
    );
    if (!stream_) {
        teardown();
        return std::unexpected("failed to create stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    // No RT_PROCESS: the meter callback takes a lock, so process() runs on
    // the thread loop rather than the realtime data thread.
    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS),
        params, 1
    );
    if (ret < 0) {
        teardown();
        return std::unexpected(std::string("stream connect failed: ") + spa_strerror(ret));
    }

    ring_buf_.reset();
    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(std::string("thread loop start failed: ") + spa_strerror(ret));
    }

    return current_path_;
}

std::expected<fs::path, std::string> PipeWireCapture::stop_recording() {
    if (!capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("not capturing");
    }
    capturing_.store(false, std::memory_order_release);
    teardown();

    auto samples = ring_buf_.drain_all();
    last_duration_ = static_cast<double>(samples.size()) / sample_rate_;
    if (ring_buf_.dropped() > 0) {
        std::println(stderr, "audio: ring buffer full, dropped {} samples", ring_buf_.dropped());
    }

    auto path = std::exchange(current_path_, {});
    auto written = wav::write_file(path, samples, sample_rate_);
    if (!written) {
        return std::unexpected(written.error());
    }
    return path;
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    std::span<const int16_t> samples(data, d->chunk->size / sizeof(int16_t));

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.write(samples);
        if (self->meter_cb_ && !samples.empty()) {
            self->meter_cb_(measure(samples, self->sample_rate_));
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
