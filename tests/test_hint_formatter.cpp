#include <catch2/catch_test_macros.hpp>

#include "hint_formatter.hpp"

namespace te = transcribe_error;

TEST_CASE("Display language resolution", "[hint]") {
    REQUIRE(resolve_language("zh", "en_US.UTF-8") == DisplayLanguage::Chinese);
    REQUIRE(resolve_language("en", "zh_CN.UTF-8") == DisplayLanguage::English);
    REQUIRE(resolve_language("auto", "zh_TW.UTF-8") == DisplayLanguage::Chinese);
    REQUIRE(resolve_language("auto", "de_DE.UTF-8") == DisplayLanguage::English);
    REQUIRE(resolve_language("auto", "") == DisplayLanguage::English);
    REQUIRE(resolve_language("", "zh") == DisplayLanguage::Chinese);
}

TEST_CASE("Error to hint mapping", "[hint]") {
    REQUIRE(hint_for(te::Network{"refused"}) == Hint::Network);
    REQUIRE(hint_for(te::Timeout{}) == Hint::Network);
    REQUIRE(hint_for(te::EmptyText{}) == Hint::NoSpeech);
    REQUIRE(hint_for(te::AudioFileNotReady{}) == Hint::NoSpeech);
    REQUIRE(hint_for(te::Unauthorized{}) == Hint::Generic);
    REQUIRE(hint_for(te::Server{500, "x"}) == Hint::Generic);
    REQUIRE(hint_for(te::InvalidResponse{}) == Hint::Generic);
    REQUIRE(hint_for(te::FileTooLarge{}) == Hint::Generic);
    REQUIRE(hint_for(te::TrimFailed{"x"}) == Hint::Generic);
}

TEST_CASE("Hint text", "[hint]") {
    SECTION("English") {
        REQUIRE(hint_text(Hint::Network, DisplayLanguage::English) == "Network");
        REQUIRE(hint_text(Hint::NoSpeech, DisplayLanguage::English) == "No speech");
        REQUIRE(hint_text(Hint::Generic, DisplayLanguage::English) == "Try again");
    }

    SECTION("Chinese") {
        REQUIRE(hint_text(Hint::Network, DisplayLanguage::Chinese) == "网络异常");
        REQUIRE(hint_text(Hint::NoSpeech, DisplayLanguage::Chinese) == "未识别语音");
        REQUIRE(hint_text(Hint::Generic, DisplayLanguage::Chinese) == "请重试");
    }

    SECTION("HintsNeverCarryDiagnostics") {
        for (auto hint : {Hint::Network, Hint::NoSpeech, Hint::Generic, Hint::PasteFailed,
                          Hint::MicrophoneUnavailable, Hint::ShortcutFailed}) {
            REQUIRE_FALSE(hint_text(hint, DisplayLanguage::English).empty());
            REQUIRE(hint_text(hint, DisplayLanguage::English).size() < 32);
        }
    }
}
