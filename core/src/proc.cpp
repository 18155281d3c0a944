#include "mcpforge/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace mcpforge {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_tok = false;

    auto flush = [&]() {
        if (have_tok) {
            out.push_back(cur);
            cur.clear();
            have_tok = false;
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_tok = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string resolve_command_path(const std::string& cmd) {
    if (cmd.empty() || cmd.find('/') != std::string::npos) return cmd;
    static const char* kDirs[] = {
        "/usr/local/bin", "/usr/bin", "/bin", "/usr/local/sbin", "/usr/sbin", "/sbin",
    };
    for (const char* d : kDirs) {
        std::string p = std::string(d) + "/" + cmd;
        struct stat st{};
        if (::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0) {
            return p;
        }
    }
    return cmd;
}

std::string tail_excerpt(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t start = s.size() - max_bytes;
    size_t nl = s.find('\n', start);
    if (nl != std::string::npos && nl + 1 < s.size()) start = nl + 1;
    return s.substr(start);
}

namespace {

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

// Shared body of both public entry points. has_stdin=false gives the child /dev/null.
bool run_capture(const std::vector<std::string>& argv,
                 const std::string& cwd,
                 const ProcEnv& env,
                 bool has_stdin,
                 const std::string& stdin_data,
                 const ProcLimits& lim,
                 ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }
    if (has_stdin && pipe(in_pipe) != 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    set_nonblock(out_pipe[0]);
    set_nonblock(err_pipe[0]);

    pid_t pid = fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        if (has_stdin) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }

        for (const auto& kv : env) {
            (void)setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = -1;
    if (has_stdin) {
        close(in_pipe[0]);
        in_fd = in_pipe[1];
        if (stdin_data.empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            set_nonblock(in_fd);
        }
    }
    size_t write_off = 0;

    auto append = [&](std::string& dst, const char* buf, ssize_t n) {
        size_t can = lim.output_max_bytes > dst.size() ? (lim.output_max_bytes - dst.size()) : 0;
        size_t take = (size_t)n;
        if (take > can) {
            take = can;
            res->output_truncated = true;
        }
        if (take > 0) dst.append(buf, buf + take);
    };

    // Returns false once the fd reached EOF.
    auto drain = [&](int fd, std::string& dst) -> bool {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) { append(dst, buf, n); continue; }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    };

    auto start = std::chrono::steady_clock::now();
    bool out_open = true;
    bool err_open = true;
    bool child_exited = false;
    int status = 0;

    while (true) {
        if (!child_exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) child_exited = true;
        }
        // Grandchildren may hold the pipes open; the direct child's exit ends the loop.
        if (child_exited) break;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 100;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (out_open) {
            out_idx = nfds;
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (err_open) {
            err_idx = nfds;
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }

        int pr = poll(fds, (nfds_t)nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // child closed stdin; stop writing
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            out_open = drain(out_pipe[0], res->out);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            err_open = drain(err_pipe[0], res->err);
        }
    }

    if (in_fd >= 0) close(in_fd);

    (void)drain(out_pipe[0], res->out);
    (void)drain(err_pipe[0], res->err);
    close(out_pipe[0]);
    close(err_pipe[0]);

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcEnv& env,
                      const ProcLimits& lim,
                      ProcResult* res) {
    return run_capture(argv, cwd, env, false, std::string(), lim, res);
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const ProcEnv& env,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    return run_capture(argv, cwd, env, true, stdin_data, lim, res);
}

} // namespace mcpforge
