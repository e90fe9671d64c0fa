#include <catch2/catch_test_macros.hpp>

#include "commands.hpp"

#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::expected<json, std::string> build(std::vector<std::string> args) {
    return build_command(args);
}

} // namespace

TEST_CASE("Client command building", "[client]") {
    SECTION("SimpleCommands") {
        for (std::string name : {"press", "release", "start", "stop", "toggle", "cancel",
                                 "status", "usage"}) {
            auto cmd = build({name});
            REQUIRE(cmd.has_value());
            REQUIRE((*cmd)["cmd"] == name);
        }
    }

    SECTION("HistoryDefaultLimit") {
        auto cmd = build({"history"});
        REQUIRE(cmd.has_value());
        REQUIRE((*cmd)["limit"] == 10);
    }

    SECTION("HistoryExplicitLimit") {
        auto cmd = build({"history", "--limit", "3"});
        REQUIRE(cmd.has_value());
        REQUIRE((*cmd)["limit"] == 3);
    }

    SECTION("HistoryBadLimit") {
        REQUIRE_FALSE(build({"history", "--limit", "abc"}).has_value());
        REQUIRE_FALSE(build({"history", "--limit", "0"}).has_value());
        REQUIRE_FALSE(build({"history", "--limit", "5x"}).has_value());
        REQUIRE_FALSE(build({"history", "--verbose"}).has_value());
    }

    SECTION("HotkeyQueryAndSet") {
        auto query = build({"hotkey"});
        REQUIRE(query.has_value());
        REQUIRE_FALSE(query->contains("shortcut"));

        auto set = build({"hotkey", "Mod4+space"});
        REQUIRE(set.has_value());
        REQUIRE((*set)["shortcut"] == "Mod4+space");
    }

    SECTION("UnknownAndMissing") {
        REQUIRE_FALSE(build({}).has_value());
        auto unknown = build({"dance"});
        REQUIRE_FALSE(unknown.has_value());
        REQUIRE(unknown.error() == "unknown command: dance");
    }
}

TEST_CASE("Client reply handling", "[client]") {
    SECTION("OnlyStopAndToggleWait") {
        REQUIRE(waits_for_transcription("stop"));
        REQUIRE(waits_for_transcription("toggle"));
        REQUIRE_FALSE(waits_for_transcription("press"));
        REQUIRE_FALSE(waits_for_transcription("release"));
        REQUIRE_FALSE(waits_for_transcription("status"));
    }

    SECTION("ExitCodes") {
        REQUIRE(print_response("status", json{{"status", "ok"}, {"state", "idle"}}) == 0);
        REQUIRE(print_response("stop", json{{"status", "ok"}, {"text", "hi"}}) == 0);
        REQUIRE(print_response("cancel", json{{"status", "error"}, {"message", "nothing"}}) == 1);
        REQUIRE(print_response("usage", json{{"status", "ok"}, {"seconds", 1.0}, {"cost", 0.0},
                                             {"models", json::array()}}) == 0);
    }
}
