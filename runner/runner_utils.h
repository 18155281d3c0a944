#pragma once

#include <string>

namespace mcpforge {

// Absolute path of the running executable (/proc/self/exe, then argv0).
std::string self_exe_path(const char* argv0);

// SIGINT/SIGTERM set a flag instead of killing the process. Installed without
// SA_RESTART so blocking accept()/poll() return EINTR.
void install_stop_handlers();
bool stop_requested();

// Write the whole buffer, retrying on EINTR. False on any other error.
bool write_all(int fd, const std::string& data);

int env_port(int defv);

} // namespace mcpforge
