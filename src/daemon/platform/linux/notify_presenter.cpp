#include "platform/linux/notify_presenter.hpp"

#include "platform/linux/child_process.hpp"

#include <print>

namespace {

constexpr const char* kSyncHint = "string:x-canonical-private-synchronous:presstalk";

} // namespace

NotifyPresenter::NotifyPresenter(DisplayLanguage language)
    : language_(language) {}

void NotifyPresenter::show_listening() {
    preview_.reset();
    bool zh = language_ == DisplayLanguage::Chinese;
    notify("low", 0, zh ? "正在聆听…" : "Listening…");
}

void NotifyPresenter::show_transcribing() {
    bool zh = language_ == DisplayLanguage::Chinese;
    notify("low", 0, zh ? "正在转写…" : "Transcribing…");
}

void NotifyPresenter::update_transcribing_preview(const std::string& text) {
    if (!preview_.admit(text, PreviewThrottle::Clock::now())) return;
    bool zh = language_ == DisplayLanguage::Chinese;
    notify("low", 0, zh ? "正在转写…" : "Transcribing…", text);
}

void NotifyPresenter::show_success(const std::string& text) {
    bool zh = language_ == DisplayLanguage::Chinese;
    notify("normal", 0, zh ? "已复制" : "Copied", text);
}

void NotifyPresenter::show_error(const std::string& hint) {
    notify("critical", 0, hint);
}

void NotifyPresenter::dismiss() {
    preview_.reset();
    notify("low", 1, " ");
}

void NotifyPresenter::notify(const std::string& urgency, int timeout_ms,
                             const std::string& summary, const std::string& body) {
    std::vector<std::string> args = {
        "-a", "presstalk",
        "-u", urgency,
        "-t", std::to_string(timeout_ms),
        "-h", kSyncHint,
        summary,
    };
    if (!body.empty()) args.push_back(body);

    auto res = run_command("notify-send", args);
    if (!res) {
        std::println(stderr, "hud: {}", res.error());
    }
}
