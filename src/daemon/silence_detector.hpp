#pragma once

struct SilenceDetectorConfig {
    float silence_threshold_db = -45.0f;
    double silence_duration_ms = 1000.0;
    double start_guard_ms = 300.0;
    bool require_speech_before_auto_stop = true;
    float speech_activate_db = -32.0f;
    float ema_alpha = 0.2f;
};

struct SilenceDebugInfo {
    float db_instant = 0.0f;
    float db_ema = 0.0f;
    double frame_duration_ms = 0.0;
    double recording_elapsed_ms = 0.0;
    double silence_accum_ms = 0.0;
    bool has_spoken = false;
    bool should_auto_stop = false;
};

// Decides when a recording has gone quiet long enough to stop on its own.
// Loudness is smoothed with an EMA so single quiet frames between words
// do not count as silence.
class SilenceDetector {
public:
    struct Result {
        bool should_auto_stop = false;
        SilenceDebugInfo debug;
    };

    SilenceDetector() = default;
    explicit SilenceDetector(const SilenceDetectorConfig& config);

    void update_config(const SilenceDetectorConfig& config) { config_ = config; }
    const SilenceDetectorConfig& config() const { return config_; }
    void reset();

    Result ingest(float db_instant, double frame_duration_ms, double recording_elapsed_ms);

    bool has_spoken() const { return has_spoken_; }
    double silence_accum_ms() const { return silence_accum_ms_; }

private:
    static constexpr float kFloorDb = -120.0f;

    SilenceDetectorConfig config_;
    float db_ema_ = kFloorDb;
    bool initialized_ = false;
    bool has_spoken_ = false;
    double silence_accum_ms_ = 0.0;
};
