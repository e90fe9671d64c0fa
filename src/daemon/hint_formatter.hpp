#pragma once

#include "transcribe/errors.hpp"

#include <string>
#include <string_view>

enum class DisplayLanguage { English, Chinese };

enum class Hint {
    Network,
    NoSpeech,
    Generic,
    PasteFailed,
    MicrophoneUnavailable,
    ShortcutFailed,
};

// First non-empty of LC_ALL, LC_MESSAGES, LANG.
std::string system_locale();

// setting is "en", "zh" or "auto"; auto looks at the locale string.
DisplayLanguage resolve_language(std::string_view setting, std::string_view locale);

Hint hint_for(const TranscribeError& err);
std::string_view hint_text(Hint hint, DisplayLanguage lang);
