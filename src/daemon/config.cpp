#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "text_util.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

RetryPolicy Config::retry_policy() const {
    return RetryPolicy{
        .max_attempts = retry.max_attempts < 1 ? 1 : retry.max_attempts,
        .initial_delay = std::chrono::milliseconds(retry.initial_delay_ms),
    };
}

std::string Config::resolved_api_key() const {
    if (!backend.api_key.empty()) return backend.api_key;
    const char* env = std::getenv("OPENAI_API_KEY");
    return env ? std::string(text::trim(env)) : std::string{};
}

std::optional<std::string> Config::effective_prompt(double recorded_seconds) const {
    auto prompt = text::trimmed(backend.prompt);
    if (prompt.empty() || recorded_seconds < backend.prompt_min_seconds) {
        return std::nullopt;
    }
    return prompt;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", cfg.backend.type);
            read_key(b, "url", cfg.backend.url);
            read_key(b, "api_format", cfg.backend.api_format);
            read_key(b, "model", cfg.backend.model);
            read_key(b, "language", cfg.backend.language);
            read_key(b, "api_key", cfg.backend.api_key);
            read_key(b, "prompt", cfg.backend.prompt);
            read_key(b, "prompt_min_seconds", cfg.backend.prompt_min_seconds);
            read_key(b, "timeout_s", cfg.backend.timeout_s);
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            read_key(r, "max_attempts", cfg.retry.max_attempts);
            read_key(r, "initial_delay_ms", cfg.retry.initial_delay_ms);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            read_key(o, "auto_paste", cfg.output.auto_paste);
            read_key(o, "paste_delay_ms", cfg.output.paste_delay_ms);
            read_key(o, "paste_keys", cfg.output.paste_keys);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
            read_key(a, "min_seconds", cfg.audio.min_seconds);
            read_key(a, "vad_trim", cfg.audio.vad_trim);
        }

        if (j.contains("auto_stop")) {
            auto& s = j["auto_stop"];
            auto& d = cfg.auto_stop.detector;
            read_key(s, "enabled", cfg.auto_stop.enabled);
            read_key(s, "silence_threshold_db", d.silence_threshold_db);
            read_key(s, "silence_duration_ms", d.silence_duration_ms);
            read_key(s, "start_guard_ms", d.start_guard_ms);
            read_key(s, "require_speech", d.require_speech_before_auto_stop);
            read_key(s, "speech_activate_db", d.speech_activate_db);
            read_key(s, "ema_alpha", d.ema_alpha);
            read_key(s, "debug_logs", cfg.auto_stop.debug_logs);
        }

        if (j.contains("hud")) {
            auto& h = j["hud"];
            read_key(h, "success_min_s", cfg.hud.success_min_s);
            read_key(h, "success_max_s", cfg.hud.success_max_s);
            read_key(h, "chars_per_second", cfg.hud.chars_per_second);
            read_key(h, "error_delay_s", cfg.hud.error_delay_s);
        }

        if (j.contains("hotkey")) {
            read_key(j["hotkey"], "shortcut", cfg.hotkey.shortcut);
        }

        if (j.contains("ui")) {
            read_key(j["ui"], "language", cfg.ui.language);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
