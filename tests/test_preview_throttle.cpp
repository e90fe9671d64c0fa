#include <catch2/catch_test_macros.hpp>

#include "preview_throttle.hpp"
#include "transcribe/keep_warm_gate.hpp"

using namespace std::chrono_literals;

TEST_CASE("Preview throttle", "[preview]") {
    PreviewThrottle throttle(250ms);
    PreviewThrottle::Clock::time_point t0{};

    SECTION("FirstPreviewAdmitted") {
        REQUIRE(throttle.admit("he", t0));
    }

    SECTION("RepeatDropped") {
        REQUIRE(throttle.admit("he", t0));
        REQUIRE_FALSE(throttle.admit("he", t0 + 1s));
    }

    SECTION("RateLimited") {
        REQUIRE(throttle.admit("he", t0));
        REQUIRE_FALSE(throttle.admit("hel", t0 + 100ms));
        REQUIRE(throttle.admit("hello", t0 + 250ms));
    }

    SECTION("ResetForgetsHistory") {
        REQUIRE(throttle.admit("he", t0));
        throttle.reset();
        REQUIRE(throttle.admit("he", t0 + 10ms));
    }
}

TEST_CASE("Keep-warm gate", "[preview]") {
    KeepWarmGate gate(20000ms);
    KeepWarmGate::Clock::time_point t0{};

    SECTION("OneInFlight") {
        REQUIRE(gate.begin(t0));
        REQUIRE_FALSE(gate.begin(t0 + 30s));
        gate.finish();
        REQUIRE(gate.begin(t0 + 30s));
    }

    SECTION("MinimumInterval") {
        REQUIRE(gate.begin(t0));
        gate.finish();
        REQUIRE_FALSE(gate.begin(t0 + 19s));
        REQUIRE(gate.begin(t0 + 20s));
    }
}
