#include "commands.hpp"

#include <charconv>
#include <print>

using json = nlohmann::json;

namespace {

std::expected<int, std::string> parse_limit(const std::string& value) {
    int limit = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
    if (ec != std::errc{} || ptr != value.data() + value.size() || limit <= 0) {
        return std::unexpected("invalid --limit: " + value);
    }
    return limit;
}

} // namespace

std::expected<json, std::string> build_command(std::span<const std::string> args) {
    if (args.empty()) return std::unexpected("missing command");

    const std::string& command = args[0];
    auto rest = args.subspan(1);

    if (command == "press" || command == "release" || command == "start" ||
        command == "stop" || command == "toggle" || command == "cancel" ||
        command == "status" || command == "usage") {
        return json{{"cmd", command}};
    }

    if (command == "history") {
        int limit = 10;
        for (size_t i = 0; i < rest.size(); i++) {
            if (rest[i] == "--limit" && i + 1 < rest.size()) {
                auto parsed = parse_limit(rest[++i]);
                if (!parsed) return std::unexpected(parsed.error());
                limit = *parsed;
            } else {
                return std::unexpected("unexpected argument: " + rest[i]);
            }
        }
        return json{{"cmd", "history"}, {"limit", limit}};
    }

    if (command == "hotkey") {
        json cmd = {{"cmd", "hotkey"}};
        if (!rest.empty()) cmd["shortcut"] = rest[0];
        return cmd;
    }

    return std::unexpected("unknown command: " + command);
}

bool waits_for_transcription(const std::string& command) {
    return command == "stop" || command == "toggle";
}

int print_response(const std::string& command, const json& response) {
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("shortcut")) {
            std::println("Shortcut: {}", response["shortcut"].get<std::string>());
        }
        if (response.contains("message")) {
            std::println("Last: {}", response["message"].get<std::string>());
        }
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
            if (entry.contains("model") && entry["model"].is_string() &&
                !entry["model"].get<std::string>().empty()) {
                std::println("  {:.1f}s audio, {:.1f}s processing, {}",
                             entry.value("audio_duration", 0.0),
                             entry.value("processing_time", 0.0),
                             entry["model"].get<std::string>());
            }
        }
    } else if (command == "usage") {
        std::println("Today: {:.1f}s transcribed, ${:.4f} estimated",
                     response.value("seconds", 0.0), response.value("cost", 0.0));
        for (auto& m : response.value("models", json::array())) {
            std::println("  {}: {} recordings, {:.1f}s, ${:.4f}",
                         m.value("model", ""), m.value("count", 0),
                         m.value("seconds", 0.0), m.value("cost", 0.0));
        }
    } else if (command == "hotkey") {
        std::println("Shortcut: {}", response.value("shortcut", ""));
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (status == "ok" || status == "transcribing") {
        std::println("{}", response.value("message", std::string(status == "ok" ? "OK" : status)));
    } else {
        std::println("{}", response.dump(2));
    }
    return 0;
}
