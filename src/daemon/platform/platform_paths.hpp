#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
// Scratch space for in-flight recordings.
std::string runtime_dir();
std::string ipc_endpoint();

} // namespace platform
