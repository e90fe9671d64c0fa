#pragma once

#include <expected>
#include <string>

class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual std::expected<void, std::string> copy(const std::string& text) = 0;
    // Sends the paste chord to the focused window.
    virtual std::expected<void, std::string> auto_paste() = 0;
};
