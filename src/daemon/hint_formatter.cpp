#include "hint_formatter.hpp"

#include <cstdlib>
#include <variant>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

std::string system_locale() {
    for (const char* var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }
    return {};
}

DisplayLanguage resolve_language(std::string_view setting, std::string_view locale) {
    if (setting == "zh") return DisplayLanguage::Chinese;
    if (setting == "en") return DisplayLanguage::English;
    return locale.starts_with("zh") ? DisplayLanguage::Chinese : DisplayLanguage::English;
}

Hint hint_for(const TranscribeError& err) {
    using namespace transcribe_error;
    return std::visit(overloaded{
        [](const Network&) { return Hint::Network; },
        [](const Timeout&) { return Hint::Network; },
        [](const EmptyText&) { return Hint::NoSpeech; },
        [](const AudioFileNotReady&) { return Hint::NoSpeech; },
        [](const auto&) { return Hint::Generic; },
    }, err);
}

std::string_view hint_text(Hint hint, DisplayLanguage lang) {
    bool zh = lang == DisplayLanguage::Chinese;
    switch (hint) {
        case Hint::Network: return zh ? "网络异常" : "Network";
        case Hint::NoSpeech: return zh ? "未识别语音" : "No speech";
        case Hint::Generic: return zh ? "请重试" : "Try again";
        case Hint::PasteFailed: return zh ? "粘贴失败" : "Paste failed";
        case Hint::MicrophoneUnavailable: return zh ? "麦克风不可用" : "Microphone unavailable";
        case Hint::ShortcutFailed: return zh ? "快捷键注册失败" : "Shortcut failed";
    }
    return zh ? "请重试" : "Try again";
}
