#pragma once

namespace platform {

void daemonize();

} // namespace platform
