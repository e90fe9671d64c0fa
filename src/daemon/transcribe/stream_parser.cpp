#include "stream_parser.hpp"

#include "../text_util.hpp"

#include <initializer_list>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::optional<std::string> extract_string(const json& object,
                                          std::initializer_list<std::string_view> keys) {
    auto search_nested = [&keys](const json& value) -> std::optional<std::string> {
        if (value.is_object()) {
            return extract_string(value, keys);
        }
        if (value.is_array()) {
            for (const auto& item : value) {
                if (!item.is_object()) continue;
                if (auto found = extract_string(item, keys)) return found;
            }
        }
        return std::nullopt;
    };

    for (auto key : keys) {
        auto it = object.find(std::string(key));
        if (it == object.end()) continue;
        if (it->is_string()) {
            const auto& s = it->get_ref<const std::string&>();
            if (!s.empty()) return s;
            continue;
        }
        if (auto found = search_nested(*it)) return found;
    }

    for (const auto& [key, value] : object.items()) {
        if (auto found = search_nested(value)) return found;
    }
    return std::nullopt;
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) return it->get<std::string>();
    return {};
}

} // namespace

StreamEvent StreamParser::parse(std::string_view payload) const {
    using namespace stream_event;

    auto object = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (object.is_discarded() || !object.is_object()) {
        return Ignore{};
    }

    std::string event_type = string_field(object, "type");
    if (event_type.empty()) event_type = string_field(object, "event");

    if (event_type == "error") {
        auto message = extract_string(object, {"message", "error"});
        return Error{message.value_or("Unknown streaming error")};
    }
    if (auto it = object.find("error"); it != object.end() && it->is_object()) {
        auto message = string_field(*it, "message");
        if (!message.empty()) return Error{std::move(message)};
    }

    if (event_type.find("delta") != std::string::npos) {
        return Delta{extract_string(object, {"delta", "text"}).value_or("")};
    }
    if (event_type.find("done") != std::string::npos) {
        return Done{extract_string(object, {"text", "transcript"}).value_or("")};
    }

    if (auto delta = extract_string(object, {"delta"})) {
        return Delta{std::move(*delta)};
    }
    if (auto text = extract_string(object, {"text"})) {
        return Done{std::move(*text)};
    }
    return Ignore{};
}

StreamAccumulator::StreamAccumulator(DeltaCallback on_delta)
    : on_delta_(std::move(on_delta)) {}

void StreamAccumulator::feed(std::string_view chunk) {
    pending_.append(chunk);

    size_t pos;
    while (!finished_ && (pos = pending_.find('\n')) != std::string::npos) {
        std::string line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        handle_line(line);
    }
}

void StreamAccumulator::finish() {
    if (!finished_ && !pending_.empty()) {
        std::string line = std::move(pending_);
        pending_.clear();
        handle_line(line);
    }
}

void StreamAccumulator::handle_line(std::string_view line) {
    using namespace stream_event;

    auto trimmed = text::trim(line);
    if (trimmed.empty()) return;

    auto payload = trimmed;
    if (payload.starts_with("data:")) {
        payload = text::trim(payload.substr(5));
    }
    if (payload == "[DONE]") {
        finished_ = true;
        return;
    }

    auto event = parser_.parse(payload);
    if (auto* delta = std::get_if<Delta>(&event)) {
        if (delta->text.empty()) return;
        aggregated_ += delta->text;
        if (on_delta_) on_delta_(aggregated_);
    } else if (auto* done = std::get_if<Done>(&event)) {
        auto final_text = text::trimmed(done->text);
        if (!final_text.empty()) {
            final_text_ = std::move(final_text);
            finished_ = true;
        }
    } else if (auto* error = std::get_if<Error>(&event)) {
        error_ = error->message;
        finished_ = true;
    }
}
