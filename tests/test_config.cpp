#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "pt_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "http");
        REQUIRE(cfg.backend.url == "https://api.openai.com");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.model == "gpt-4o-mini-transcribe");
        REQUIRE(cfg.backend.language.empty());
        REQUIRE(cfg.retry.max_attempts == 3);
        REQUIRE(cfg.output.auto_paste);
        REQUIRE(cfg.output.paste_delay_ms == 120);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.audio.ring_buffer_samples() == 120 * 16000);
        REQUIRE(cfg.auto_stop.enabled);
        REQUIRE(cfg.auto_stop.detector.silence_threshold_db == -45.0f);
        REQUIRE(cfg.auto_stop.detector.silence_duration_ms == 1000.0);
        REQUIRE(cfg.hotkey.shortcut == "Mod1+space");
        REQUIRE(cfg.ui.language == "auto");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "http",
                "url": "http://10.0.0.1:9090",
                "api_format": "whisper.cpp",
                "model": "gpt-4o-transcribe",
                "language": "de",
                "api_key": "sk-test",
                "prompt": "PressTalk, PipeWire",
                "timeout_s": 30
            },
            "retry": { "max_attempts": 5, "initial_delay_ms": 100 },
            "output": { "auto_paste": false, "paste_delay_ms": 250, "paste_keys": "ctrl+shift+v" },
            "audio": { "sample_rate": 48000, "max_seconds": 60, "min_seconds": 0.5, "vad_trim": false },
            "auto_stop": {
                "enabled": false,
                "silence_threshold_db": -50,
                "silence_duration_ms": 1500,
                "start_guard_ms": 500,
                "require_speech": false,
                "speech_activate_db": -30,
                "ema_alpha": 0.3,
                "debug_logs": true
            },
            "hud": { "success_min_s": 1, "success_max_s": 5 },
            "hotkey": { "shortcut": "Mod4+Shift+space" },
            "ui": { "language": "zh" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "whisper.cpp");
        REQUIRE(cfg.backend.model == "gpt-4o-transcribe");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.api_key == "sk-test");
        REQUIRE(cfg.backend.timeout_s == 30);
        REQUIRE(cfg.retry.max_attempts == 5);
        REQUIRE(cfg.output.auto_paste == false);
        REQUIRE(cfg.output.paste_delay_ms == 250);
        REQUIRE(cfg.output.paste_keys == "ctrl+shift+v");
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.max_seconds == 60);
        REQUIRE(cfg.audio.min_seconds == 0.5);
        REQUIRE(cfg.audio.vad_trim == false);
        REQUIRE(cfg.auto_stop.enabled == false);
        REQUIRE(cfg.auto_stop.detector.silence_threshold_db == -50.0f);
        REQUIRE(cfg.auto_stop.detector.silence_duration_ms == 1500.0);
        REQUIRE(cfg.auto_stop.detector.start_guard_ms == 500.0);
        REQUIRE(cfg.auto_stop.detector.require_speech_before_auto_stop == false);
        REQUIRE(cfg.auto_stop.debug_logs);
        REQUIRE(cfg.hud.success_max_s == 5.0);
        REQUIRE(cfg.hotkey.shortcut == "Mod4+Shift+space");
        REQUIRE(cfg.ui.language == "zh");
        REQUIRE(cfg.resolved_api_key() == "sk-test");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.type == "http");
        REQUIRE(cfg.backend.url == "https://api.openai.com");
        REQUIRE(cfg.output.paste_delay_ms == 120);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.type == "http");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/pt_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "http");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }
}

TEST_CASE("Config derived values", "[config]") {
    Config cfg;

    SECTION("RetryPolicyFromSection") {
        cfg.retry.max_attempts = 4;
        cfg.retry.initial_delay_ms = 250;
        auto policy = cfg.retry_policy();
        REQUIRE(policy.max_attempts == 4);
        REQUIRE(policy.initial_delay == std::chrono::milliseconds(250));
    }

    SECTION("RetryPolicyAtLeastOneAttempt") {
        cfg.retry.max_attempts = 0;
        REQUIRE(cfg.retry_policy().max_attempts == 1);
    }

    SECTION("PromptNeedsEnoughAudio") {
        cfg.backend.prompt = "  glossary  ";
        cfg.backend.prompt_min_seconds = 1.0;
        REQUIRE_FALSE(cfg.effective_prompt(0.5).has_value());
        REQUIRE(cfg.effective_prompt(1.0) == std::optional<std::string>("glossary"));
    }

    SECTION("BlankPromptOmitted") {
        cfg.backend.prompt = "   ";
        REQUIRE_FALSE(cfg.effective_prompt(10.0).has_value());
    }

    SECTION("ApiKeyFromEnvironment") {
        ::setenv("OPENAI_API_KEY", " sk-env \n", 1);
        REQUIRE(cfg.resolved_api_key() == "sk-env");
        ::unsetenv("OPENAI_API_KEY");
        REQUIRE(cfg.resolved_api_key().empty());
    }
}
