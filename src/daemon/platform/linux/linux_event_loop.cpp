#include "platform/linux/linux_event_loop.hpp"

#include "hint_formatter.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_, config_.audio.sample_rate, platform::runtime_dir()),
      backend_(HttpBackendOptions{
          .url = config_.backend.url,
          .api_format = config_.backend.api_format,
          .timeout_s = config_.backend.timeout_s,
      }),
      presenter_(resolve_language(config_.ui.language, system_locale())),
      clipboard_(config_.output.paste_keys),
      core_(config_, verbose_,
            DaemonCore::Services{
                .queue = queue_,
                .audio = audio_capture_,
                .hotkey = hotkey_,
                .transcriber = backend_,
                .trimmer = trimmer_,
                .presenter = presenter_,
                .clipboard = clipboard_,
                .ipc = ipc_server_,
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    queue_.set_wake_callback({});
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.backend.type != "http") {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }
    if (config_.backend.api_format == "openai" && config_.resolved_api_key().empty()) {
        std::println(stderr, "Warning: no API key (backend.api_key or $OPENAI_API_KEY)");
    }

    // Queue wake-ups; set before anything can post.
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }
    queue_.set_wake_callback([fd = wake_fd_] {
        uint64_t val = 1;
        if (::write(fd, &val, sizeof(val)) < 0 && errno != EAGAIN) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    });

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (history db, hotkey registration, meter wiring)
    auto data = platform::data_dir();
    auto db_path = (data.empty() ? std::string("/tmp/presstalk") : data) + "/history.db";
    if (!core_.init(db_path)) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    // Helpers that exit early must not take the daemon down with them.
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(wake_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        auto next = queue_.time_until_next();
        int timeout = next ? static_cast<int>(next->count()) : -1;

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == wake_fd_) {
                uint64_t val;
                // Drain the counter; the tasks themselves run below.
                while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
                continue;
            }

            handle_client(fd);
        }

        queue_.run_pending();
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        std::string cmd_str = DaemonCore::command_name(cmd);
        nlohmann::json response;

        if (cmd_str == "press" || cmd_str == "release") {
            hotkey_.dispatch(cmd_str == "press");
            response = {{"status", "ok"}, {"state", std::string(to_string(core_.phase()))}};
        } else {
            response = core_.handle_command(cmd_str, cmd);
        }

        if (response.value("status", "") == "transcribing") {
            core_.add_waiting_client(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }

    if (!open) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        ipc_server_.close_client(fd);
        core_.remove_waiting_client(fd);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[presstalk] {}", msg);
    }
}
