#include "errors.hpp"

#include <format>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string describe(const TranscribeError& err) {
    using namespace transcribe_error;
    return std::visit(overloaded{
        [](const AudioFileNotReady&) -> std::string { return "audio file not ready"; },
        [](const FileTooLarge&) -> std::string { return "audio file exceeds upload limit"; },
        [](const Unauthorized&) -> std::string { return "unauthorized (check API key)"; },
        [](const Network& e) -> std::string { return "network error: " + e.reason; },
        [](const Timeout&) -> std::string { return "request timed out"; },
        [](const Server& e) -> std::string {
            return std::format("server error ({}): {}", e.status, e.message);
        },
        [](const InvalidResponse&) -> std::string { return "unparseable server response"; },
        [](const EmptyText&) -> std::string { return "no text recognized"; },
        [](const TrimFailed& e) -> std::string { return "silence trim failed: " + e.message; },
        [](const Cancelled&) -> std::string { return "cancelled"; },
    }, err);
}
