#include "silence_detector.hpp"

#include <algorithm>

SilenceDetector::SilenceDetector(const SilenceDetectorConfig& config)
    : config_(config) {}

void SilenceDetector::reset() {
    db_ema_ = kFloorDb;
    initialized_ = false;
    has_spoken_ = false;
    silence_accum_ms_ = 0.0;
}

SilenceDetector::Result SilenceDetector::ingest(float db_instant, double frame_duration_ms,
                                                double recording_elapsed_ms) {
    // Valid alpha is (0, 1]; zero or negative would freeze the estimate.
    float alpha = config_.ema_alpha > 0.0f ? std::min(config_.ema_alpha, 1.0f) : 0.01f;
    if (initialized_) {
        db_ema_ = alpha * db_instant + (1.0f - alpha) * db_ema_;
    } else {
        db_ema_ = db_instant;
        initialized_ = true;
    }

    if (db_ema_ >= config_.speech_activate_db) {
        has_spoken_ = true;
    }

    bool guard_passed = recording_elapsed_ms >= config_.start_guard_ms;
    bool speech_ready = !config_.require_speech_before_auto_stop || has_spoken_;

    if (guard_passed && speech_ready && db_ema_ < config_.silence_threshold_db) {
        silence_accum_ms_ += frame_duration_ms;
    } else {
        silence_accum_ms_ = 0.0;
    }

    bool should_stop = guard_passed && speech_ready &&
                       silence_accum_ms_ >= config_.silence_duration_ms;

    return Result{
        .should_auto_stop = should_stop,
        .debug = SilenceDebugInfo{
            .db_instant = db_instant,
            .db_ema = db_ema_,
            .frame_duration_ms = frame_duration_ms,
            .recording_elapsed_ms = recording_elapsed_ms,
            .silence_accum_ms = silence_accum_ms_,
            .has_spoken = has_spoken_,
            .should_auto_stop = should_stop,
        },
    };
}
