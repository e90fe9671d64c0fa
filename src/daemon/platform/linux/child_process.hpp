#pragma once

#include <expected>
#include <string>
#include <sys/types.h>
#include <vector>

// Reaps pid and turns a non-zero exit into an error naming the program.
std::expected<void, std::string> wait_child(pid_t pid, const std::string& program);

// fork/execvp program with args and wait for it.
std::expected<void, std::string> run_command(const std::string& program,
                                             const std::vector<std::string>& args);

// Like run_command, with input written to the child's stdin. The child
// closing stdin early is an error, never a SIGPIPE.
std::expected<void, std::string> run_with_input(const std::string& program,
                                                const std::vector<std::string>& args,
                                                const std::string& input);
