#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

std::expected<void, std::string> wait_child(pid_t pid, const std::string& program) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(program + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(program + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return {};
}

namespace {

std::vector<char*> make_argv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

} // namespace

std::expected<void, std::string> run_command(const std::string& program,
                                             const std::vector<std::string>& args) {
    auto argv = make_argv(program, args);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        ::execvp(program.c_str(), argv.data());
        ::_exit(127);
    }

    return wait_child(pid, program);
}

std::expected<void, std::string> run_with_input(const std::string& program,
                                                const std::vector<std::string>& args,
                                                const std::string& input) {
    auto argv = make_argv(program, args);

    // A socketpair rather than a pipe so writes can use MSG_NOSIGNAL.
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return std::unexpected(std::string("socketpair() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(fds[0], STDIN_FILENO);
        ::execvp(program.c_str(), argv.data());
        ::_exit(127);
    }

    ::close(fds[0]);
    std::string write_error;
    size_t total_written = 0;
    while (total_written < input.size()) {
        ssize_t n = ::send(fds[1], input.data() + total_written, input.size() - total_written,
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            write_error = std::string("write to ") + program + " failed: " + std::strerror(errno);
            break;
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(fds[1]);

    // The exit status says more than EPIPE does.
    auto waited = wait_child(pid, program);
    if (!waited) return waited;
    if (!write_error.empty()) return std::unexpected(write_error);
    return {};
}
