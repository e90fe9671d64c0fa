#pragma once

#include "platform/clipboard.hpp"

#include <string>
#include <vector>

// wl-copy for the clipboard, wtype for the paste chord.
class WaylandClipboard : public Clipboard {
public:
    // paste_keys such as "ctrl+v" or "ctrl+shift+v".
    explicit WaylandClipboard(std::string paste_keys = "ctrl+v",
                              std::string copy_program = "wl-copy");

    std::expected<void, std::string> copy(const std::string& text) override;
    std::expected<void, std::string> auto_paste() override;

    // wtype argv for the configured chord, without the program name.
    std::vector<std::string> paste_args() const;

private:
    std::string paste_keys_;
    std::string copy_program_;
};
