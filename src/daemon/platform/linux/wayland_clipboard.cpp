#include "platform/linux/wayland_clipboard.hpp"

#include "platform/linux/child_process.hpp"

WaylandClipboard::WaylandClipboard(std::string paste_keys, std::string copy_program)
    : paste_keys_(std::move(paste_keys)), copy_program_(std::move(copy_program)) {}

std::expected<void, std::string> WaylandClipboard::copy(const std::string& text) {
    return run_with_input(copy_program_, {}, text);
}

std::vector<std::string> WaylandClipboard::paste_args() const {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= paste_keys_.size()) {
        auto plus = paste_keys_.find('+', pos);
        if (plus == std::string::npos) plus = paste_keys_.size();
        if (plus > pos) parts.push_back(paste_keys_.substr(pos, plus - pos));
        pos = plus + 1;
    }
    if (parts.empty()) parts = {"ctrl", "v"};

    std::vector<std::string> args;
    for (size_t i = 0; i + 1 < parts.size(); i++) {
        args.push_back("-M");
        args.push_back(parts[i]);
    }
    args.push_back("-k");
    args.push_back(parts.back());
    return args;
}

std::expected<void, std::string> WaylandClipboard::auto_paste() {
    return run_command("wtype", paste_args());
}
