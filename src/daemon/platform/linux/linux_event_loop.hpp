#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "event_queue.hpp"
#include "platform/linux/notify_presenter.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/sway_hotkey_source.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "ring_buffer.hpp"
#include "transcribe/http_backend.hpp"
#include "transcribe/vad_trimmer.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Owner-thread queue; must outlive every collaborator that posts to it.
    EventQueue queue_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    SwayHotkeySource hotkey_;
    HttpBackend backend_;
    VadTrimmer trimmer_;
    NotifyPresenter presenter_;
    WaylandClipboard clipboard_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int wake_fd_ = -1;

    std::atomic<bool> running_{false};
};
