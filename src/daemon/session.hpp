#pragma once

#include "platform/audio_capture.hpp"
#include "silence_detector.hpp"

#include <functional>
#include <optional>

enum class StopTrigger { ManualRelease, AutoSilence, MaxDuration };

struct AutoStopDecision {
    bool should_auto_stop = false;
    std::optional<SilenceDebugInfo> debug_info;
};

// Owns one push-to-talk recording: the one-shot stop gate and the per-frame
// auto-stop evaluation. Not thread-safe; driven from the daemon's owner thread.
class RecordingSession {
public:
    // Seconds since an arbitrary origin. Allowed to jump backwards.
    using UptimeProvider = std::function<double()>;

    explicit RecordingSession(UptimeProvider uptime = {});

    void begin_session(const SilenceDetectorConfig& config);

    // Returns true only for the call that wins the stop; auto-silence may
    // win at most once per session even across abort_stop().
    bool begin_stop(StopTrigger trigger);
    void abort_stop();
    // Ends the session; the gate stays engaged until the next begin_session().
    void finish_stop();

    AutoStopDecision evaluate_auto_stop(const MeterSample& sample, bool enabled,
                                        const SilenceDetectorConfig& config);

    bool is_active() const { return started_at_.has_value(); }
    bool stop_in_flight() const { return stop_in_flight_; }
    double recording_duration();

private:
    double read_uptime();

    UptimeProvider uptime_;
    SilenceDetector detector_;
    std::optional<double> started_at_;
    std::optional<double> last_uptime_;
    bool stop_in_flight_ = false;
    bool auto_stop_fired_ = false;
};
