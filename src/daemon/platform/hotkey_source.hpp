#pragma once

#include <expected>
#include <functional>
#include <string>

class HotkeySource {
public:
    using Callback = std::function<void()>;

    virtual ~HotkeySource() = default;
    virtual void set_callbacks(Callback on_down, Callback on_up) = 0;
    virtual std::expected<void, std::string> register_shortcut(const std::string& shortcut) = 0;
};
