#include "hotkey_shortcut.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

// Returns false if token is not a modifier name.
bool apply_modifier(Shortcut& sc, std::string_view token) {
    auto name = lower(token);
    if (name == "mod1" || name == "alt") {
        sc.mod1 = true;
    } else if (name == "mod4" || name == "super" || name == "logo") {
        sc.mod4 = true;
    } else if (name == "ctrl" || name == "control") {
        sc.ctrl = true;
    } else if (name == "shift") {
        sc.shift = true;
    } else {
        return false;
    }
    return true;
}

// Keysym names only; anything else would be spliced into a sway command.
bool valid_key(std::string_view token) {
    return std::ranges::all_of(token, [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

} // namespace

std::string Shortcut::to_string() const {
    std::string out;
    if (mod1) out += "Mod1+";
    if (mod4) out += "Mod4+";
    if (ctrl) out += "Ctrl+";
    if (shift) out += "Shift+";
    out += key;
    return out;
}

std::expected<Shortcut, std::string> parse_shortcut(std::string_view combo) {
    combo = text::trim(combo);
    if (combo.empty()) {
        return std::unexpected("empty shortcut");
    }

    Shortcut sc;
    size_t pos = 0;
    while (pos <= combo.size()) {
        auto plus = combo.find('+', pos);
        if (plus == std::string_view::npos) plus = combo.size();
        auto token = text::trim(combo.substr(pos, plus - pos));
        pos = plus + 1;

        if (token.empty()) {
            return std::unexpected(std::string("malformed shortcut: ") + std::string(combo));
        }
        if (apply_modifier(sc, token)) continue;
        if (!sc.key.empty()) {
            return std::unexpected(std::string("more than one key in shortcut: ") + std::string(combo));
        }
        if (!valid_key(token)) {
            return std::unexpected(std::string("invalid key in shortcut: ") + std::string(combo));
        }
        sc.key = std::string(token);
    }

    if (sc.key.empty()) {
        return std::unexpected(std::string("shortcut has no key: ") + std::string(combo));
    }
    if (!sc.has_modifier()) {
        return std::unexpected(std::string("shortcut needs a modifier: ") + std::string(combo));
    }
    return sc;
}
