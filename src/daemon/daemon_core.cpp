#include "daemon_core.hpp"

#include "storage/usage_cost.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <print>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::lround(seconds * 1000.0)));
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, Services services,
                       RecordingSession::UptimeProvider uptime)
    : config_(std::move(config)), verbose_(verbose), svc_(services),
      session_(std::move(uptime)),
      coordinator_(svc_.transcriber, svc_.trimmer, config_.retry_policy()) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& history_path) {
    language_ = resolve_language(config_.ui.language, system_locale());

    if (!history_path.empty() && !history_db_.open(history_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    svc_.audio.set_meter_callback([this](const MeterSample& sample) {
        svc_.queue.post([this, sample] { on_meter_sample(sample); });
    });
    svc_.hotkey.set_callbacks([this] { on_key_down(); }, [this] { on_key_up(); });

    if (auto parsed = parse_shortcut(config_.hotkey.shortcut)) {
        config_.hotkey.shortcut = parsed->to_string();
    } else {
        std::println(stderr, "config: {}, using {}", parsed.error(), kDefaultShortcut);
        config_.hotkey.shortcut = std::string(kDefaultShortcut);
    }

    auto registered = svc_.hotkey.register_shortcut(config_.hotkey.shortcut);
    if (!registered) {
        std::println(stderr, "hotkey: {} (press/release via presstalk-ctl still work)",
                     registered.error());
    } else {
        log("Shortcut " + config_.hotkey.shortcut);
    }
    return true;
}

void DaemonCore::on_key_down() {
    switch (phase_) {
        case SessionPhase::Transcribing:
            cancel_transcription();
            break;
        case SessionPhase::Idle:
            begin_listening();
            break;
        case SessionPhase::Listening:
            break;
    }
}

void DaemonCore::on_key_up() {
    if (phase_ == SessionPhase::Listening) {
        stop(StopTrigger::ManualRelease);
    }
}

void DaemonCore::on_meter_sample(const MeterSample& sample) {
    if (phase_ != SessionPhase::Listening) return;

    auto decision = session_.evaluate_auto_stop(sample, config_.auto_stop.enabled,
                                                config_.auto_stop.detector);
    if (config_.auto_stop.debug_logs && decision.debug_info) {
        log_meter(*decision.debug_info);
    }
    if (decision.should_auto_stop) {
        log("Silence detected, stopping");
        stop(StopTrigger::AutoSilence);
    }
}

bool DaemonCore::begin_listening() {
    if (!svc_.audio.request_permission()) {
        log("Microphone not available");
        show_failure(Hint::MicrophoneUnavailable);
        return false;
    }

    auto started = svc_.audio.start_recording();
    if (!started) {
        log("Recording failed to start: " + started.error());
        show_failure(Hint::MicrophoneUnavailable);
        return false;
    }

    session_.begin_session(config_.auto_stop.detector);
    last_meter_log_ms_ = -1e9;
    cancel_timer(dismiss_timer_);
    cancel_timer(paste_timer_);
    last_message_.clear();

    set_phase(SessionPhase::Listening);
    svc_.presenter.show_listening();

    max_duration_timer_ = svc_.queue.post_after(
        std::chrono::seconds(config_.audio.max_seconds), [this] {
            max_duration_timer_.reset();
            log("Max duration reached, stopping");
            stop(StopTrigger::MaxDuration);
        });

    svc_.transcriber.keep_warm();
    log("Recording started");
    return true;
}

void DaemonCore::stop(StopTrigger trigger) {
    if (phase_ != SessionPhase::Listening) return;
    if (!session_.begin_stop(trigger)) return;

    cancel_timer(max_duration_timer_);
    auto recorded = svc_.audio.stop_recording();
    double seconds = svc_.audio.last_duration();

    // Straight from listening to transcribing; the short-clip check below
    // may then drop to idle, but idle is never seen in between.
    set_phase(SessionPhase::Transcribing);

    if (!recorded) {
        session_.finish_stop();
        log("Recording failed: " + recorded.error());
        set_phase(SessionPhase::Idle);
        show_failure(Hint::MicrophoneUnavailable);
        reply_waiting_clients({{"status", "error"}, {"message", recorded.error()}});
        return;
    }

    if (seconds < config_.audio.min_seconds) {
        session_.abort_stop();
        session_.finish_stop();
        std::error_code ec;
        fs::remove(*recorded, ec);
        log(std::format("Recording too short ({:.2f}s), discarded", seconds));
        set_phase(SessionPhase::Idle);
        svc_.presenter.dismiss();
        return;
    }

    session_.finish_stop();
    log(std::format("Recording stopped, {:.1f}s audio, transcribing...", seconds));
    svc_.presenter.show_transcribing();
    start_transcription(std::move(*recorded), seconds);
}

bool DaemonCore::cancel_transcription() {
    if (phase_ != SessionPhase::Transcribing) return false;

    if (auto it = workers_.find(current_job_); it != workers_.end()) {
        it->second.request_stop();
    }
    current_job_ = 0;
    log("Transcription cancelled");

    cancel_timer(dismiss_timer_);
    last_message_.clear();
    set_phase(SessionPhase::Idle);
    svc_.presenter.dismiss();
    reply_waiting_clients({{"status", "error"}, {"message", "cancelled"}});
    return true;
}

void DaemonCore::start_transcription(fs::path audio, double seconds) {
    uint64_t job = next_job_++;
    current_job_ = job;

    TranscriptionRequestOptions options{
        .enable_vad_trim = config_.audio.vad_trim,
        .model = config_.backend.model,
        .prompt = config_.effective_prompt(seconds),
        .language = config_.backend.language.empty()
            ? std::nullopt : std::optional<std::string>(config_.backend.language),
    };

    workers_.emplace(job, std::jthread([this, job, audio = std::move(audio), seconds,
                                        options = std::move(options),
                                        api_key = config_.resolved_api_key()]
                                       (std::stop_token stop) {
        auto started = std::chrono::steady_clock::now();
        auto on_delta = [this, job](const std::string& text) {
            svc_.queue.post([this, job, text] { on_transcription_delta(job, text); });
        };

        auto result = coordinator_.transcribe(audio, seconds, options, api_key, on_delta, stop);

        Outcome outcome{
            .result = std::move(result),
            .audio_seconds = seconds,
            .processing_seconds = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - started).count(),
        };
        svc_.queue.post([this, job, outcome = std::move(outcome)]() mutable {
            on_transcription_complete(job, std::move(outcome));
        });
    }));
}

void DaemonCore::on_transcription_delta(uint64_t job, const std::string& text) {
    if (job != current_job_ || phase_ != SessionPhase::Transcribing) return;
    svc_.presenter.update_transcribing_preview(text);
}

void DaemonCore::on_transcription_complete(uint64_t job, Outcome outcome) {
    reap_worker(job);
    if (job != current_job_) {
        log(std::format("Discarding result of superseded job {}", job));
        return;
    }
    current_job_ = 0;

    auto& result = outcome.result;
    if (!result) {
        if (is_cancelled(result.error())) {
            set_phase(SessionPhase::Idle);
            svc_.presenter.dismiss();
            reply_waiting_clients({{"status", "error"}, {"message", "cancelled"}});
            return;
        }

        log("Transcription failed: " + describe(result.error()));
        set_phase(SessionPhase::Idle);
        show_failure(hint_for(result.error()));
        reply_waiting_clients({{"status", "error"}, {"message", describe(result.error())}});
        return;
    }

    const std::string& text = *result;
    log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                    outcome.processing_seconds, text.size()));

    auto copied = svc_.clipboard.copy(text);
    set_phase(SessionPhase::Idle);
    if (copied) {
        last_message_ = text;
        svc_.presenter.show_success(text);
        schedule_dismiss(config_.hud.success_delay(text));
        if (config_.output.auto_paste) schedule_paste();
    } else {
        log("Clipboard copy failed: " + copied.error());
        show_failure(Hint::PasteFailed);
    }

    if (history_db_.is_open() &&
        !history_db_.insert(text, outcome.audio_seconds, outcome.processing_seconds,
                            config_.backend.model, config_.backend.type)) {
        std::println(stderr, "history: insert failed");
    }

    reply_waiting_clients({
        {"status", "ok"},
        {"text", text},
        {"duration", outcome.audio_seconds},
        {"processing_time", outcome.processing_seconds},
    });
}

void DaemonCore::reap_worker(uint64_t job) {
    auto it = workers_.find(job);
    if (it == workers_.end()) return;
    // The worker posts its completion as its last act, so this join is brief.
    if (it->second.joinable()) it->second.join();
    workers_.erase(it);
}

std::expected<void, std::string> DaemonCore::update_hotkey(const std::string& shortcut) {
    auto failed = std::string(hint_text(Hint::ShortcutFailed, language_));

    auto parsed = parse_shortcut(shortcut);
    if (!parsed) {
        log("Rejected shortcut: " + parsed.error());
        return std::unexpected(failed);
    }

    auto combo = parsed->to_string();
    auto registered = svc_.hotkey.register_shortcut(combo);
    if (!registered) {
        log("Shortcut " + combo + " failed: " + registered.error() +
            ", restoring " + config_.hotkey.shortcut);
        auto restored = svc_.hotkey.register_shortcut(config_.hotkey.shortcut);
        if (!restored) {
            std::println(stderr, "hotkey: restoring {} failed: {}",
                         config_.hotkey.shortcut, restored.error());
        }
        return std::unexpected(failed);
    }

    config_.hotkey.shortcut = combo;
    log("Shortcut " + combo);
    return {};
}

std::string DaemonCore::command_name(const json& cmd) {
    if (!cmd.is_object()) return {};
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "cancel") {
        if (!cancel_transcription()) {
            return {{"status", "error"}, {"message", "nothing to cancel"}};
        }
        return {{"status", "ok"}, {"message", "cancelled"}};
    }
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "usage") return handle_usage(cmd);
    if (cmd_str == "hotkey") return handle_hotkey(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_start(const json& /*cmd*/) {
    if (phase_ != SessionPhase::Idle) {
        return {{"status", "error"}, {"message", "already recording or transcribing"}};
    }
    if (!begin_listening()) {
        return {{"status", "error"}, {"message", "failed to start recording"}};
    }
    return {{"status", "ok"}, {"message", "recording"}};
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    if (phase_ != SessionPhase::Listening) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    stop(StopTrigger::ManualRelease);
    if (phase_ == SessionPhase::Transcribing) {
        return {{"status", "transcribing"}, {"duration", svc_.audio.last_duration()}};
    }
    return {{"status", "ok"}, {"message", "recording too short, discarded"}};
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (phase_ == SessionPhase::Listening) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"state", std::string(to_string(phase_))}};
    if (phase_ == SessionPhase::Listening) {
        resp["duration"] = session_.recording_duration();
    }
    if (!last_message_.empty()) {
        resp["message"] = last_message_;
    }
    resp["shortcut"] = config_.hotkey.shortcut;
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end()) {
        if (!it->is_number_integer()) {
            return {{"status", "error"}, {"message", "limit must be an integer"}};
        }
        limit = it->get<int>();
    }
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"model", e.model},
            {"backend", e.backend},
        });
    }
    return resp;
}

json DaemonCore::handle_usage(const json& /*cmd*/) {
    double seconds = 0.0;
    double cost = 0.0;
    json models = json::array();
    for (auto& u : history_db_.usage_today()) {
        double model_cost = estimated_cost(u.model, u.audio_seconds);
        seconds += u.audio_seconds;
        cost += model_cost;
        models.push_back({
            {"model", u.model},
            {"seconds", u.audio_seconds},
            {"count", u.count},
            {"cost", model_cost},
        });
    }
    return {{"status", "ok"}, {"seconds", seconds}, {"cost", cost}, {"models", models}};
}

json DaemonCore::handle_hotkey(const json& cmd) {
    std::string shortcut;
    if (auto it = cmd.find("shortcut"); it != cmd.end()) {
        if (!it->is_string()) {
            return {{"status", "error"}, {"message", "shortcut must be a string"},
                    {"shortcut", config_.hotkey.shortcut}};
        }
        shortcut = it->get<std::string>();
    }
    if (shortcut.empty()) {
        return {{"status", "ok"}, {"shortcut", config_.hotkey.shortcut}};
    }
    auto updated = update_hotkey(shortcut);
    if (!updated) {
        return {{"status", "error"}, {"message", updated.error()},
                {"shortcut", config_.hotkey.shortcut}};
    }
    return {{"status", "ok"}, {"shortcut", config_.hotkey.shortcut}};
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::add_phase_observer(PhaseObserver observer) {
    observers_.push_back(std::move(observer));
}

void DaemonCore::shutdown() {
    cancel_timer(max_duration_timer_);
    cancel_timer(dismiss_timer_);
    cancel_timer(paste_timer_);

    if (phase_ == SessionPhase::Listening) {
        if (auto recorded = svc_.audio.stop_recording()) {
            std::error_code ec;
            fs::remove(*recorded, ec);
        }
        session_.finish_stop();
    }

    if (!workers_.empty()) {
        log("Cancelling pending transcription...");
    }
    for (auto& [job, worker] : workers_) {
        worker.request_stop();
    }
    // jthread joins on destruction.
    workers_.clear();
    current_job_ = 0;
}

void DaemonCore::show_failure(Hint hint) {
    last_message_ = std::string(hint_text(hint, language_));
    svc_.presenter.show_error(last_message_);
    schedule_dismiss(config_.hud.error_delay());
}

void DaemonCore::schedule_dismiss(double seconds) {
    cancel_timer(dismiss_timer_);
    dismiss_timer_ = svc_.queue.post_after(to_ms(seconds), [this] {
        dismiss_timer_.reset();
        svc_.presenter.dismiss();
    });
}

void DaemonCore::schedule_paste() {
    cancel_timer(paste_timer_);
    paste_timer_ = svc_.queue.post_after(
        std::chrono::milliseconds(config_.output.paste_delay_ms), [this] {
            paste_timer_.reset();
            auto pasted = svc_.clipboard.auto_paste();
            if (!pasted) {
                log("Auto-paste failed: " + pasted.error());
                show_failure(Hint::PasteFailed);
            }
        });
}

void DaemonCore::cancel_timer(std::optional<EventQueue::TimerId>& timer) {
    if (timer) {
        svc_.queue.cancel(*timer);
        timer.reset();
    }
}

void DaemonCore::set_phase(SessionPhase phase) {
    if (phase == phase_) return;
    phase_ = phase;
    for (auto& observer : observers_) {
        observer(phase_);
    }
}

void DaemonCore::reply_waiting_clients(const json& response) {
    for (int fd : waiting_clients_) {
        if (!svc_.ipc.send_response(fd, response)) {
            log(std::format("Client {} went away before the reply", fd));
        }
    }
    waiting_clients_.clear();
}

void DaemonCore::log_meter(const SilenceDebugInfo& info) {
    constexpr double kMeterLogIntervalMs = 150.0;
    if (!info.should_auto_stop &&
        info.recording_elapsed_ms - last_meter_log_ms_ < kMeterLogIntervalMs) {
        return;
    }
    last_meter_log_ms_ = info.recording_elapsed_ms;
    log(std::format("meter: t={:.0f}ms db={:.1f} ema={:.1f} silence={:.0f}ms spoken={} stop={}",
                    info.recording_elapsed_ms, info.db_instant, info.db_ema,
                    info.silence_accum_ms, info.has_spoken, info.should_auto_stop));
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[presstalk] {}", msg);
    }
}
