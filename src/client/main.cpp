#include "commands.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  press | release          Push-to-talk key down / key up");
    std::println(stderr, "  start                    Start recording");
    std::println(stderr, "  stop                     Stop recording and wait for the text");
    std::println(stderr, "  toggle                   Start or stop recording");
    std::println(stderr, "  cancel                   Abandon the running transcription");
    std::println(stderr, "  status                   Show daemon status");
    std::println(stderr, "  history [--limit N]      Show transcription history");
    std::println(stderr, "  usage                    Show today's usage and cost");
    std::println(stderr, "  hotkey [SHORTCUT]        Show or change the shortcut (e.g. Mod4+space)");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "--help" || args[0] == "-h") {
        usage(argv[0]);
        return 0;
    }

    auto cmd = build_command(args);
    if (!cmd) {
        std::println(stderr, "{}", cmd.error());
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is presstalkd running?");
        return 1;
    }

    if (!client.send(*cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // press/release are run by the compositor and must never hang it.
    int timeout_ms = waits_for_transcription(args[0]) ? 180000 : 5000;
    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    return print_response(args[0], response);
}
