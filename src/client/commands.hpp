#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

// Turns "presstalk-ctl <command> [options]" into the request sent to the daemon.
std::expected<nlohmann::json, std::string> build_command(std::span<const std::string> args);

// Human-readable rendering of a daemon reply. Returns the process exit code.
int print_response(const std::string& command, const nlohmann::json& response);

// Commands whose reply may only arrive after a transcription finishes.
bool waits_for_transcription(const std::string& command);
