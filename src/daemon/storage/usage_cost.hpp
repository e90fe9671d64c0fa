#pragma once

#include <string_view>

// USD per minute of uploaded audio. Unknown models (local servers) are free.
inline double cost_per_minute(std::string_view model) {
    if (model == "gpt-4o-mini-transcribe") return 0.003;
    if (model == "gpt-4o-transcribe") return 0.006;
    return 0.0;
}

inline double estimated_cost(std::string_view model, double audio_seconds) {
    return cost_per_minute(model) * audio_seconds / 60.0;
}
