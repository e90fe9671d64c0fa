#include "session.hpp"

#include <algorithm>
#include <chrono>

RecordingSession::RecordingSession(UptimeProvider uptime)
    : uptime_(std::move(uptime)) {
    if (!uptime_) {
        uptime_ = [] {
            auto now = std::chrono::steady_clock::now().time_since_epoch();
            return std::chrono::duration<double>(now).count();
        };
    }
}

void RecordingSession::begin_session(const SilenceDetectorConfig& config) {
    detector_ = SilenceDetector(config);
    // A clock that jumped back last session must not hold this one at zero.
    last_uptime_.reset();
    started_at_ = read_uptime();
    stop_in_flight_ = false;
    auto_stop_fired_ = false;
}

bool RecordingSession::begin_stop(StopTrigger trigger) {
    if (stop_in_flight_) return false;
    if (trigger == StopTrigger::AutoSilence && auto_stop_fired_) return false;

    stop_in_flight_ = true;
    if (trigger == StopTrigger::AutoSilence) {
        auto_stop_fired_ = true;
    }
    return true;
}

void RecordingSession::abort_stop() {
    stop_in_flight_ = false;
}

void RecordingSession::finish_stop() {
    started_at_.reset();
}

AutoStopDecision RecordingSession::evaluate_auto_stop(const MeterSample& sample, bool enabled,
                                                      const SilenceDetectorConfig& config) {
    if (!enabled || stop_in_flight_ || !started_at_) {
        return {};
    }

    detector_.update_config(config);

    double elapsed_ms = std::max(0.0, read_uptime() - *started_at_) * 1000.0;
    auto result = detector_.ingest(sample.db_instant, sample.frame_duration_ms, elapsed_ms);
    return AutoStopDecision{
        .should_auto_stop = result.should_auto_stop,
        .debug_info = result.debug,
    };
}

double RecordingSession::recording_duration() {
    if (!started_at_) return 0.0;
    return std::max(0.0, read_uptime() - *started_at_);
}

double RecordingSession::read_uptime() {
    double now = uptime_();
    if (last_uptime_ && now < *last_uptime_) {
        now = *last_uptime_;
    }
    last_uptime_ = now;
    return now;
}
