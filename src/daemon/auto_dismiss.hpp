#pragma once

#include <string_view>

// How long a finished result stays on the HUD. Longer text stays longer,
// within [success_min_s, success_max_s].
struct AutoDismiss {
    double success_min_s = 1.5;
    double success_max_s = 4.0;
    double chars_per_second = 15.0;
    double error_delay_s = 3.0;

    double success_delay(std::string_view text) const;
    double error_delay() const { return error_delay_s; }
};
