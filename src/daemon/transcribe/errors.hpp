#pragma once

#include <string>
#include <variant>

// Terminal outcomes of the transcription pipeline other than success.
namespace transcribe_error {

struct AudioFileNotReady {
    bool operator==(const AudioFileNotReady&) const = default;
};
struct FileTooLarge {
    bool operator==(const FileTooLarge&) const = default;
};
struct Unauthorized {
    bool operator==(const Unauthorized&) const = default;
};
struct Network {
    std::string reason;
    bool operator==(const Network&) const = default;
};
struct Timeout {
    bool operator==(const Timeout&) const = default;
};
struct Server {
    int status = 0;
    std::string message;
    bool operator==(const Server&) const = default;
};
struct InvalidResponse {
    bool operator==(const InvalidResponse&) const = default;
};
struct EmptyText {
    bool operator==(const EmptyText&) const = default;
};
struct TrimFailed {
    std::string message;
    bool operator==(const TrimFailed&) const = default;
};
// Not a failure: the owning session abandoned the call.
struct Cancelled {
    bool operator==(const Cancelled&) const = default;
};

} // namespace transcribe_error

using TranscribeError = std::variant<
    transcribe_error::AudioFileNotReady,
    transcribe_error::FileTooLarge,
    transcribe_error::Unauthorized,
    transcribe_error::Network,
    transcribe_error::Timeout,
    transcribe_error::Server,
    transcribe_error::InvalidResponse,
    transcribe_error::EmptyText,
    transcribe_error::TrimFailed,
    transcribe_error::Cancelled>;

inline bool is_cancelled(const TranscribeError& err) {
    return std::holds_alternative<transcribe_error::Cancelled>(err);
}

// Full diagnostic text for logs; never shown in the HUD.
std::string describe(const TranscribeError& err);
