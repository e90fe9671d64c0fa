#pragma once

#include "platform/hotkey_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Registers the push-to-talk binding with sway. sway runs
// "presstalk-ctl press" / "presstalk-ctl release"; the daemon turns those
// IPC commands into key-down / key-up on its owner thread.
class SwayHotkeySource : public HotkeySource {
public:
    explicit SwayHotkeySource(std::string ctl_command = "presstalk-ctl");
    ~SwayHotkeySource() override;

    SwayHotkeySource(const SwayHotkeySource&) = delete;
    SwayHotkeySource& operator=(const SwayHotkeySource&) = delete;

    void set_callbacks(Callback on_down, Callback on_up) override;
    std::expected<void, std::string> register_shortcut(const std::string& shortcut) override;

    // Runs on the owner thread.
    void dispatch(bool down);

    // sway commands that bind/unbind combo. Exposed for tests.
    static std::vector<std::string> bind_commands(const std::string& combo,
                                                  const std::string& ctl_command);
    static std::vector<std::string> unbind_commands(const std::string& combo);

    // A RUN_COMMAND reply is a JSON array of {"success": bool, "error": "..."}.
    static std::expected<void, std::string> check_reply(const std::string& payload);

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;

    bool connect();
    std::expected<void, std::string> run_command(const std::string& command);
    bool send_message(uint32_t type, const std::string& payload);
    bool recv_message(uint32_t& type, std::string& payload);

    std::string ctl_command_;
    std::string bound_combo_;
    Callback on_down_;
    Callback on_up_;
    int fd_ = -1;
};
