#include "auto_dismiss.hpp"

#include "text_util.hpp"

#include <algorithm>

double AutoDismiss::success_delay(std::string_view text) const {
    auto length = text::utf8_length(text::trim(text));
    if (length == 0 || chars_per_second <= 0.0) return success_min_s;

    double seconds = static_cast<double>(length) / chars_per_second;
    return std::clamp(seconds, success_min_s, std::max(success_min_s, success_max_s));
}
