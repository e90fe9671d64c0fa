#pragma once

#include "auto_dismiss.hpp"
#include "hotkey_shortcut.hpp"
#include "silence_detector.hpp"
#include "transcribe/retry_policy.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct Config {
    struct Backend {
        std::string type = "http";
        std::string url = "https://api.openai.com";
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model = "gpt-4o-mini-transcribe";
        std::string language;              // empty: let the server detect
        std::string api_key;               // empty: $OPENAI_API_KEY
        std::string prompt;
        double prompt_min_seconds = 1.0;
        long timeout_s = 60;
    } backend;

    struct Retry {
        int max_attempts = 3;
        uint32_t initial_delay_ms = 400;
    } retry;

    struct Output {
        bool auto_paste = true;
        uint32_t paste_delay_ms = 120;
        std::string paste_keys = "ctrl+v"; // or "ctrl+shift+v" for terminals
    } output;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        double min_seconds = 0.2;
        bool vad_trim = true;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct AutoStop {
        bool enabled = true;
        SilenceDetectorConfig detector;
        bool debug_logs = false;
    } auto_stop;

    AutoDismiss hud;

    struct Hotkey {
        std::string shortcut = std::string(kDefaultShortcut);
    } hotkey;

    struct Ui {
        std::string language = "auto"; // "auto", "en" or "zh"
    } ui;

    RetryPolicy retry_policy() const;

    // backend.api_key, else $OPENAI_API_KEY.
    std::string resolved_api_key() const;

    // The prompt only helps once there is enough audio for it to bias.
    std::optional<std::string> effective_prompt(double recorded_seconds) const;

    static Config load(const std::string& path);
    static Config load_default();
};
