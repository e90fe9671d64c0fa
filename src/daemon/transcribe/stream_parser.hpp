#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace stream_event {

struct Delta {
    std::string text;
    bool operator==(const Delta&) const = default;
};
struct Done {
    std::string text;
    bool operator==(const Done&) const = default;
};
struct Error {
    std::string message;
    bool operator==(const Error&) const = default;
};
struct Ignore {
    bool operator==(const Ignore&) const = default;
};

} // namespace stream_event

using StreamEvent = std::variant<stream_event::Delta, stream_event::Done,
                                 stream_event::Error, stream_event::Ignore>;

// Decodes one server-sent message. Tolerates the different shapes used by
// the batch and realtime transcription endpoints:
//   {"type":"transcript.text.delta","delta":"..."}
//   {"event":"transcript.done","text":"..."}
//   {"type":"error","error":{"message":"..."}}
// Error intent always wins over delta/done.
class StreamParser {
public:
    StreamEvent parse(std::string_view payload) const;
};

// Reassembles an SSE body that arrives in arbitrary chunks and folds the
// events into an aggregate transcript.
class StreamAccumulator {
public:
    using DeltaCallback = std::function<void(const std::string&)>;

    explicit StreamAccumulator(DeltaCallback on_delta = {});

    void feed(std::string_view chunk);
    // Flushes a trailing line that had no newline.
    void finish();

    bool finished() const { return finished_; }
    const std::string& aggregated() const { return aggregated_; }
    const std::optional<std::string>& final_text() const { return final_text_; }
    const std::optional<std::string>& error() const { return error_; }

private:
    void handle_line(std::string_view line);

    StreamParser parser_;
    DeltaCallback on_delta_;
    std::string pending_;
    std::string aggregated_;
    std::optional<std::string> final_text_;
    std::optional<std::string> error_;
    bool finished_ = false;
};
