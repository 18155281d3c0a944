#include "runner_utils.h"

#include "mcpforge/config.h"

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace mcpforge {

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_stop_signal(int) {
    g_stop = 1;
}

} // namespace

std::string self_exe_path(const char* argv0) {
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !p.empty()) return p.string();
    std::filesystem::path exe = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (!exe.empty() && !exe.is_absolute()) exe = std::filesystem::absolute(exe, ec);
    return exe.string();
}

void install_stop_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    ::signal(SIGPIPE, SIG_IGN);
}

bool stop_requested() {
    return g_stop != 0;
}

bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n == -1 && errno == EINTR) continue;
        return false;
    }
    return true;
}

int env_port(int defv) {
    int port = getenv_int("PORT", defv);
    return getenv_int("MCPFORGE_HTTP_PORT", port);
}

} // namespace mcpforge
