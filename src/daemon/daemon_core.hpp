#pragma once

#include "config.hpp"
#include "event_queue.hpp"
#include "hint_formatter.hpp"
#include "platform/audio_capture.hpp"
#include "platform/clipboard.hpp"
#include "platform/hotkey_source.hpp"
#include "platform/ipc_server.hpp"
#include "platform/result_presenter.hpp"
#include "session.hpp"
#include "session_phase.hpp"
#include "storage/history_db.hpp"
#include "transcribe/coordinator.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Push-to-talk state machine. Every public method runs on the owner thread
// (the one calling EventQueue::run_pending); collaborators that call back
// from other threads are marshalled through the queue.
class DaemonCore {
public:
    using PhaseObserver = std::function<void(SessionPhase)>;

    struct Services {
        EventQueue& queue;
        AudioCapture& audio;
        HotkeySource& hotkey;
        TranscriptionService& transcriber;
        SilenceTrimmer& trimmer;
        ResultPresenter& presenter;
        Clipboard& clipboard;
        IpcServer& ipc;
    };

    DaemonCore(Config config, bool verbose, Services services,
               RecordingSession::UptimeProvider uptime = {});
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Empty history_path disables history.
    bool init(const std::string& history_path);

    void on_key_down();
    void on_key_up();
    void on_meter_sample(const MeterSample& sample);
    void stop(StopTrigger trigger);
    // Returns false if nothing was being transcribed.
    bool cancel_transcription();

    // On failure the previous shortcut is registered again and a short
    // user-facing message is returned.
    std::expected<void, std::string> update_hotkey(const std::string& shortcut);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);
    // Empty when "cmd" is missing or not a string.
    static std::string command_name(const nlohmann::json& cmd);

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    // Observers only hear about actual changes.
    void add_phase_observer(PhaseObserver observer);
    SessionPhase phase() const { return phase_; }
    const std::string& last_message() const { return last_message_; }
    const Config& config() const { return config_; }

    void shutdown();

private:
    struct Outcome {
        std::expected<std::string, TranscribeError> result;
        double audio_seconds = 0.0;
        double processing_seconds = 0.0;
    };

    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_usage(const nlohmann::json& cmd);
    nlohmann::json handle_hotkey(const nlohmann::json& cmd);

    bool begin_listening();
    void start_transcription(std::filesystem::path audio, double seconds);
    void on_transcription_delta(uint64_t job, const std::string& text);
    void on_transcription_complete(uint64_t job, Outcome outcome);
    void reap_worker(uint64_t job);

    void show_failure(Hint hint);
    void schedule_dismiss(double seconds);
    void schedule_paste();
    void cancel_timer(std::optional<EventQueue::TimerId>& timer);
    void set_phase(SessionPhase phase);
    void reply_waiting_clients(const nlohmann::json& response);
    void log_meter(const SilenceDebugInfo& info);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Services svc_;

    RecordingSession session_;
    TranscriptionCoordinator coordinator_;
    HistoryDb history_db_;
    DisplayLanguage language_ = DisplayLanguage::English;

    SessionPhase phase_ = SessionPhase::Idle;
    std::vector<PhaseObserver> observers_;
    std::string last_message_;

    std::optional<EventQueue::TimerId> max_duration_timer_;
    std::optional<EventQueue::TimerId> dismiss_timer_;
    std::optional<EventQueue::TimerId> paste_timer_;
    double last_meter_log_ms_ = 0.0;

    // 0 means no transcription is current. Cancelled jobs keep running until
    // they notice the stop request; their completions are dropped.
    uint64_t current_job_ = 0;
    uint64_t next_job_ = 1;
    std::map<uint64_t, std::jthread> workers_;

    std::vector<int> waiting_clients_;
};
