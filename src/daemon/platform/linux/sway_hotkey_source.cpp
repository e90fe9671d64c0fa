#include "platform/linux/sway_hotkey_source.hpp"

#include "hotkey_shortcut.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayHotkeySource::SwayHotkeySource(std::string ctl_command)
    : ctl_command_(std::move(ctl_command)) {}

SwayHotkeySource::~SwayHotkeySource() {
    if (fd_ >= 0) ::close(fd_);
}

void SwayHotkeySource::set_callbacks(Callback on_down, Callback on_up) {
    on_down_ = std::move(on_down);
    on_up_ = std::move(on_up);
}

void SwayHotkeySource::dispatch(bool down) {
    auto& cb = down ? on_down_ : on_up_;
    if (cb) cb();
}

std::vector<std::string> SwayHotkeySource::bind_commands(const std::string& combo,
                                                         const std::string& ctl_command) {
    return {
        "bindsym --no-repeat " + combo + " exec " + ctl_command + " press",
        "bindsym --release " + combo + " exec " + ctl_command + " release",
    };
}

std::vector<std::string> SwayHotkeySource::unbind_commands(const std::string& combo) {
    return {
        "unbindsym --no-repeat " + combo,
        "unbindsym --release " + combo,
    };
}

std::expected<void, std::string> SwayHotkeySource::check_reply(const std::string& payload) {
    auto reply = nlohmann::json::parse(payload, nullptr, false);
    if (reply.is_discarded() || !reply.is_array()) {
        return std::unexpected("malformed sway reply");
    }
    for (auto& entry : reply) {
        if (!entry.is_object()) return std::unexpected("sway rejected the command");
        auto success = entry.find("success");
        if (success == entry.end() || !success->is_boolean() || !success->get<bool>()) {
            auto error = entry.find("error");
            if (error != entry.end() && error->is_string() && !error->get<std::string>().empty()) {
                return std::unexpected(error->get<std::string>());
            }
            return std::unexpected("sway rejected the command");
        }
    }
    return {};
}

std::expected<void, std::string> SwayHotkeySource::register_shortcut(const std::string& shortcut) {
    auto parsed = parse_shortcut(shortcut);
    if (!parsed) return std::unexpected(parsed.error());
    auto combo = parsed->to_string();

    if (fd_ < 0 && !connect()) {
        return std::unexpected("sway IPC not available");
    }

    if (!bound_combo_.empty()) {
        for (auto& cmd : unbind_commands(bound_combo_)) {
            // A stale binding may already be gone; nothing to undo then.
            (void)run_command(cmd);
        }
        bound_combo_.clear();
    }

    for (auto& cmd : bind_commands(combo, ctl_command_)) {
        auto res = run_command(cmd);
        if (!res) return std::unexpected("bind " + combo + ": " + res.error());
    }

    bound_combo_ = combo;
    return {};
}

bool SwayHotkeySource::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock, sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

std::expected<void, std::string> SwayHotkeySource::run_command(const std::string& command) {
    uint32_t type;
    std::string payload;
    if (!send_message(MSG_RUN_COMMAND, command) || !recv_message(type, payload)) {
        ::close(fd_);
        fd_ = -1;
        return std::unexpected("sway IPC connection lost");
    }
    return check_reply(payload);
}

bool SwayHotkeySource::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayHotkeySource::recv_message(uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd_, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }
    return true;
}
