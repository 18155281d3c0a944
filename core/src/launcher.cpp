#include "mcpforge/launcher.h"
#include "mcpforge/errors.h"
#include "mcpforge/log.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace mcpforge {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int p[2]) {
    close_fd(p[0]);
    close_fd(p[1]);
}

int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 128;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchSpec& spec,
                                                  ExitCallback on_exit,
                                                  const std::string& log_tag) {
    if (spec.command.empty()) throw ForgeError::launch_failed("empty command");

    // write() to a dead child must return EPIPE instead of killing the supervisor
    ::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // close-on-exec: carries errno when exec fails

    if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        throw ForgeError::launch_failed(std::string("pipe failed: ") + std::strerror(e));
    }

    // Prepare everything that allocates before fork.
    std::vector<std::string> argv_s;
    argv_s.push_back(spec.command);
    argv_s.insert(argv_s.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> cargv;
    for (auto& s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_s;
    env_s.reserve(spec.env.size());
    for (const auto& kv : spec.env) env_s.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv;
    for (auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        int e = errno;
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe); close_pair(exec_pipe);
        throw ForgeError::launch_failed(std::string("fork failed: ") + std::strerror(e));
    }

    if (child == 0) {
        ::setpgid(0, 0);

        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        int report_fd = exec_pipe[1];
        long maxfd = ::sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < (int)maxfd; fd++) {
            if (fd != report_fd) ::close(fd);
        }

#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        int err = 0;
        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
            err = errno;
        } else {
            environ = cenv.data();
            ::execvp(cargv[0], cargv.data());
            err = errno;
        }
        ssize_t wr = ::write(report_fd, &err, sizeof(err));
        (void)wr;
        ::_exit(127);
    }

    // parent
    ::setpgid(child, child);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == (ssize_t)sizeof(child_errno)) {
        int st = 0;
        ::waitpid(child, &st, 0);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        throw ForgeError::launch_failed("cannot start " + spec.command + " in " + spec.cwd +
                                        ": " + std::strerror(child_errno));
    }

    std::unique_ptr<ChildProcess> cp(new ChildProcess());
    cp->pid_ = child;
    cp->stdin_fd_ = in_pipe[1];
    cp->stdout_fd_ = out_pipe[0];
    cp->stderr_fd_ = err_pipe[0];
    cp->log_tag_ = log_tag;
    cp->on_exit_ = std::move(on_exit);

    int flags = ::fcntl(cp->stderr_fd_, F_GETFL, 0);
    if (flags >= 0) ::fcntl(cp->stderr_fd_, F_SETFL, flags | O_NONBLOCK);

    cp->watcher_ = std::thread([p = cp.get()] { p->watch_loop(); });
    cp->drainer_ = std::thread([p = cp.get()] { p->drain_stderr_loop(); });

    log_debug(cp->log_tag_, "spawned pid " + std::to_string(child) + ": " + spec.command);
    return cp;
}

ChildProcess::~ChildProcess() {
    terminate(0);
    if (watcher_.joinable()) watcher_.join();
    stop_drain_.store(true);
    if (drainer_.joinable()) drainer_.join();
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

int ChildProcess::take_stdin_fd() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::take_stdout_fd() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

bool ChildProcess::exited() const {
    std::lock_guard<std::mutex> lk(mu_);
    return exited_;
}

int ChildProcess::exit_code() const {
    std::lock_guard<std::mutex> lk(mu_);
    return exit_code_;
}

void ChildProcess::watch_loop() {
    int st = 0;
    pid_t w;
    do {
        w = ::waitpid(pid_, &st, 0);
    } while (w < 0 && errno == EINTR);

    int code = (w == pid_) ? decode_status(st) : 128;
    // Whatever the worker forked dies with it, whether it ignored SIGTERM or
    // the leader exited on its own. The group id stays valid while any member
    // is alive, so this cannot reach an unrelated group.
    if (::killpg(pid_, SIGKILL) == 0) {
        log_debug(log_tag_, "killed leftover processes of group " + std::to_string(pid_));
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        exited_ = true;
        exit_code_ = code;
    }
    cv_.notify_all();
    log_debug(log_tag_, "pid " + std::to_string(pid_) + " exited with " + std::to_string(code));

    if (on_exit_) {
        try {
            on_exit_(code);
        } catch (const std::exception& e) {
            log_error(log_tag_, std::string("exit callback failed: ") + e.what());
        }
    }
}

void ChildProcess::drain_stderr_loop() {
    std::string pending;
    auto flush_lines = [&](bool all) {
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            log_info(log_tag_, "stderr: " + line);
        }
        if (all && !pending.empty()) {
            log_info(log_tag_, "stderr: " + pending);
            pending.clear();
        }
    };

    while (!stop_drain_.load()) {
        struct pollfd pfd;
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, 100);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) continue;

        char buf[4096];
        ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n > 0) {
            pending.append(buf, (size_t)n);
            flush_lines(false);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        break;  // EOF or read error
    }
    flush_lines(true);
}

void ChildProcess::terminate(int grace_ms) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (exited_ || pid_ <= 0) return;
    }
    ::killpg(pid_, SIGTERM);
    if (grace_ms > 0 && wait_for_exit(grace_ms)) return;

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (exited_) return;
    }
    log_debug(log_tag_, "pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
    ::killpg(pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
}

bool ChildProcess::wait_for_exit(int timeout_ms) {
    std::unique_lock<std::mutex> lk(mu_);
    if (timeout_ms <= 0) {
        cv_.wait(lk, [&] { return exited_; });
        return true;
    }
    return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return exited_; });
}

} // namespace mcpforge
