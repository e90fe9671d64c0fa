#pragma once

#include <expected>
#include <string>
#include <string_view>

// A sway-style key combination such as "Mod4+Shift+space".
struct Shortcut {
    bool mod1 = false;
    bool mod4 = false;
    bool ctrl = false;
    bool shift = false;
    std::string key;

    bool has_modifier() const { return mod1 || mod4 || ctrl || shift; }
    // Canonical spelling with modifiers in a fixed order.
    std::string to_string() const;

    bool operator==(const Shortcut&) const = default;
};

inline constexpr std::string_view kDefaultShortcut = "Mod1+space";

// Accepts Alt/Super/Control aliases. Requires at least one modifier and
// exactly one non-modifier key.
std::expected<Shortcut, std::string> parse_shortcut(std::string_view combo);
