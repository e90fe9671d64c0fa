#include <catch2/catch_test_macros.hpp>

#include "platform/linux/child_process.hpp"
#include "platform/linux/sway_hotkey_source.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "platform/platform_paths.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

// Speaks just enough i3-ipc to accept RUN_COMMAND messages. Commands that
// mention `reject` fail with a sway-style error.
class FakeSway {
public:
    explicit FakeSway(std::string reject = {}) : reject_(std::move(reject)) {
        path_ = "/tmp/pt_test_sway_" + std::to_string(::getpid()) + ".sock";
        ::unlink(path_.c_str());
        fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd_, 1) == 0);
        thread_ = std::jthread([this] { serve(); });
    }

    ~FakeSway() {
        ::shutdown(fd_, SHUT_RDWR);
        thread_ = {};
        ::close(fd_);
        ::unlink(path_.c_str());
    }

    const std::string& path() const { return path_; }

    std::vector<std::string> commands() {
        std::lock_guard lock(mu_);
        return commands_;
    }

private:
    static bool read_exact(int fd, char* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    void serve() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) return;

        char header[14];
        while (read_exact(client, header, sizeof(header))) {
            uint32_t len, type;
            std::memcpy(&len, header + 6, 4);
            std::memcpy(&type, header + 10, 4);
            std::string payload(len, '\0');
            if (!read_exact(client, payload.data(), len)) break;

            bool ok = reject_.empty() || payload.find(reject_) == std::string::npos;
            {
                std::lock_guard lock(mu_);
                commands_.push_back(payload);
            }

            std::string reply = ok ? R"([{"success":true}])"
                                   : R"([{"success":false,"error":"Invalid key"}])";
            uint32_t reply_len = static_cast<uint32_t>(reply.size());
            std::memcpy(header + 6, &reply_len, 4);
            ::send(client, header, sizeof(header), MSG_NOSIGNAL);
            ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
        }
        ::close(client);
    }

    std::string path_;
    std::string reject_;
    int fd_ = -1;
    std::mutex mu_;
    std::vector<std::string> commands_;
    std::jthread thread_;
};

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;
    std::optional<std::string> previous;

    EnvGuard(std::string n, const std::string& value) : name(std::move(n)) {
        if (const char* old = std::getenv(name.c_str())) previous = old;
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvGuard() {
        if (previous) {
            ::setenv(name.c_str(), previous->c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }
};

} // namespace

TEST_CASE("Sway binding commands", "[sway]") {
    SECTION("BindPressAndRelease") {
        auto cmds = SwayHotkeySource::bind_commands("Mod1+space", "presstalk-ctl");
        REQUIRE(cmds == std::vector<std::string>{
            "bindsym --no-repeat Mod1+space exec presstalk-ctl press",
            "bindsym --release Mod1+space exec presstalk-ctl release",
        });
    }

    SECTION("Unbind") {
        auto cmds = SwayHotkeySource::unbind_commands("Mod4+F9");
        REQUIRE(cmds == std::vector<std::string>{
            "unbindsym --no-repeat Mod4+F9",
            "unbindsym --release Mod4+F9",
        });
    }

    SECTION("ReplyParsing") {
        REQUIRE(SwayHotkeySource::check_reply(R"([{"success":true}])").has_value());
        REQUIRE(SwayHotkeySource::check_reply(R"([{"success":true},{"success":true}])").has_value());

        auto rejected = SwayHotkeySource::check_reply(
            R"([{"success":false,"parse_error":true,"error":"Invalid key 'foo'"}])");
        REQUIRE_FALSE(rejected.has_value());
        REQUIRE(rejected.error() == "Invalid key 'foo'");

        REQUIRE(SwayHotkeySource::check_reply(R"([{"success":false}])").error() ==
                "sway rejected the command");
        REQUIRE(SwayHotkeySource::check_reply("garbage").error() == "malformed sway reply");
        REQUIRE(SwayHotkeySource::check_reply(R"({"success":true})").error() ==
                "malformed sway reply");
        REQUIRE(SwayHotkeySource::check_reply(R"([{"success":"yes"}])").error() ==
                "sway rejected the command");
        REQUIRE(SwayHotkeySource::check_reply(R"([{"success":false,"error":7}])").error() ==
                "sway rejected the command");
    }

    SECTION("DispatchRoutesToCallbacks") {
        SwayHotkeySource source;
        std::vector<std::string> seen;
        source.dispatch(true); // no callbacks yet
        source.set_callbacks([&seen] { seen.push_back("down"); }, [&seen] { seen.push_back("up"); });
        source.dispatch(true);
        source.dispatch(false);
        REQUIRE(seen == std::vector<std::string>{"down", "up"});
    }
}

TEST_CASE("Sway shortcut registration", "[sway]") {
    SECTION("NoSwaySocket") {
        ::unsetenv("SWAYSOCK");
        SwayHotkeySource source;
        auto res = source.register_shortcut("Mod1+space");
        REQUIRE_FALSE(res.has_value());
    }

    SECTION("InvalidShortcutRejectedLocally") {
        SwayHotkeySource source;
        REQUIRE_FALSE(source.register_shortcut("space").has_value());
    }

    SECTION("RebindUnbindsPrevious") {
        FakeSway sway;
        EnvGuard env("SWAYSOCK", sway.path());
        SwayHotkeySource source("ctl");

        REQUIRE(source.register_shortcut("alt+space").has_value());
        REQUIRE(source.register_shortcut("super+r").has_value());

        auto cmds = sway.commands();
        REQUIRE(cmds == std::vector<std::string>{
            "bindsym --no-repeat Mod1+space exec ctl press",
            "bindsym --release Mod1+space exec ctl release",
            "unbindsym --no-repeat Mod1+space",
            "unbindsym --release Mod1+space",
            "bindsym --no-repeat Mod4+r exec ctl press",
            "bindsym --release Mod4+r exec ctl release",
        });
    }

    SECTION("SwayErrorReported") {
        FakeSway sway("Mod4+x");
        EnvGuard env("SWAYSOCK", sway.path());
        SwayHotkeySource source;

        auto res = source.register_shortcut("Mod4+x");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("Invalid key") != std::string::npos);
    }
}

TEST_CASE("Wayland paste chord", "[wayland]") {
    SECTION("CtrlV") {
        WaylandClipboard clip("ctrl+v");
        REQUIRE(clip.paste_args() == std::vector<std::string>{"-M", "ctrl", "-k", "v"});
    }

    SECTION("TerminalChord") {
        WaylandClipboard clip("ctrl+shift+v");
        REQUIRE(clip.paste_args() ==
                std::vector<std::string>{"-M", "ctrl", "-M", "shift", "-k", "v"});
    }

    SECTION("EmptyFallsBackToCtrlV") {
        WaylandClipboard clip("");
        REQUIRE(clip.paste_args() == std::vector<std::string>{"-M", "ctrl", "-k", "v"});
    }
}

TEST_CASE("Child processes", "[process]") {
    REQUIRE(run_command("true", {}).has_value());

    auto failed = run_command("false", {});
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error() == "false exited with code 1");

    auto missing = run_command("pt-test-no-such-program", {"x"});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().find("127") != std::string::npos);

    REQUIRE(run_command("sh", {"-c", "exit 0"}).has_value());
}

TEST_CASE("Child process input", "[process]") {
    // Larger than any socket buffer, so the writer is still blocked when
    // the child goes away.
    std::string big(4 * 1024 * 1024, 'a');

    SECTION("DeliveredToStdin") {
        REQUIRE(run_with_input("sh", {"-c", "test \"$(cat)\" = hello"}, "hello").has_value());
        REQUIRE_FALSE(run_with_input("sh", {"-c", "test \"$(cat)\" = bye"}, "hello").has_value());
    }

    SECTION("ReaderExitingEarlyIsAnError") {
        auto res = run_with_input("true", {}, big);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("true") != std::string::npos);
    }

    SECTION("MissingCopyProgramReportsFailure") {
        WaylandClipboard clip("ctrl+v", "pt-test-no-such-copy-tool");
        auto copied = clip.copy(big);
        REQUIRE_FALSE(copied.has_value());
        REQUIRE(copied.error().find("127") != std::string::npos);

        REQUIRE_FALSE(clip.copy("short text").has_value());
    }
}

TEST_CASE("Platform paths", "[paths]") {
    SECTION("XdgOverrides") {
        EnvGuard config("XDG_CONFIG_HOME", "/xdg/config");
        EnvGuard data("XDG_DATA_HOME", "/xdg/data");
        EnvGuard runtime("XDG_RUNTIME_DIR", "/run/user/1000");
        REQUIRE(platform::config_dir() == "/xdg/config/presstalk");
        REQUIRE(platform::data_dir() == "/xdg/data/presstalk");
        REQUIRE(platform::runtime_dir() == "/run/user/1000/presstalk");
        REQUIRE(platform::ipc_endpoint() == "/run/user/1000/presstalk.sock");
    }

    SECTION("HomeFallback") {
        ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_RUNTIME_DIR");
        EnvGuard home("HOME", "/home/pt");
        REQUIRE(platform::config_dir() == "/home/pt/.config/presstalk");
        REQUIRE(platform::ipc_endpoint() ==
                "/tmp/presstalk-" + std::to_string(::getuid()) + ".sock");
    }
}
