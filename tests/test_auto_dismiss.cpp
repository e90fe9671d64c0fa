#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "auto_dismiss.hpp"

#include <string>

using Catch::Matchers::WithinAbs;

TEST_CASE("HUD auto-dismiss delay", "[auto_dismiss]") {
    AutoDismiss dismiss;

    SECTION("ShortTextUsesMinimum") {
        REQUIRE_THAT(dismiss.success_delay("ok"), WithinAbs(1.5, 1e-9));
        REQUIRE_THAT(dismiss.success_delay(""), WithinAbs(1.5, 1e-9));
    }

    SECTION("ScalesWithLength") {
        std::string text(45, 'a');
        REQUIRE_THAT(dismiss.success_delay(text), WithinAbs(3.0, 1e-9));
    }

    SECTION("LongTextUsesMaximum") {
        std::string text(500, 'a');
        REQUIRE_THAT(dismiss.success_delay(text), WithinAbs(4.0, 1e-9));
    }

    SECTION("SurroundingWhitespaceIgnored") {
        std::string padded = "   " + std::string(45, 'a') + "\n\n   ";
        REQUIRE_THAT(dismiss.success_delay(padded), WithinAbs(3.0, 1e-9));
    }

    SECTION("CountsCharactersNotBytes") {
        // 30 three-byte code points
        std::string text;
        for (int i = 0; i < 30; ++i) text += "\xE4\xBD\xA0";
        REQUIRE_THAT(dismiss.success_delay(text), WithinAbs(2.0, 1e-9));
    }

    SECTION("ErrorDelayFixed") {
        REQUIRE(dismiss.error_delay() == 3.0);
    }

    SECTION("CustomBounds") {
        AutoDismiss custom{.success_min_s = 0.5, .success_max_s = 1.0,
                           .chars_per_second = 10.0, .error_delay_s = 2.0};
        REQUIRE_THAT(custom.success_delay(std::string(7, 'x')), WithinAbs(0.7, 1e-9));
        REQUIRE(custom.error_delay() == 2.0);
    }
}
