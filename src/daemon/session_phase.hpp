#pragma once

#include <string_view>

enum class SessionPhase { Idle, Listening, Transcribing };

inline bool is_recording(SessionPhase phase) {
    return phase == SessionPhase::Listening;
}

inline bool is_transcribing(SessionPhase phase) {
    return phase == SessionPhase::Transcribing;
}

inline std::string_view to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle: return "idle";
        case SessionPhase::Listening: return "listening";
        case SessionPhase::Transcribing: return "transcribing";
    }
    return "unknown";
}
