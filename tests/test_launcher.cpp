#include "test_common.h"

#include "mcpforge/errors.h"
#include "mcpforge/launcher.h"
#include "mcpforge/log.h"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace mcpforge;

static LaunchSpec sh_spec(const std::string& script) {
    LaunchSpec s;
    s.command = "/bin/sh";
    s.args = {"-c", script};
    s.cwd = "/tmp";
    s.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}};
    return s;
}

static std::string read_all(int fd) {
    std::string out;
    char buf[512];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) { out.append(buf, (size_t)n); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    return out;
}

static std::string read_line(int fd) {
    std::string out;
    char c;
    while (true) {
        ssize_t n = ::read(fd, &c, 1);
        if (n == 1) {
            if (c == '\n') break;
            out.push_back(c);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    return out;
}

// Alive and not a zombie waiting for its new parent to reap it.
static bool process_running(int pid) {
    if (::kill(pid, 0) != 0) return false;
    std::ifstream f("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!std::getline(f, stat)) return false;
    size_t rp = stat.rfind(')');
    return rp == std::string::npos || rp + 2 >= stat.size() || stat[rp + 2] != 'Z';
}

static bool wait_not_running(int pid, int timeout_ms) {
    for (int waited = 0; waited < timeout_ms; waited += 20) {
        if (!process_running(pid)) return true;
        ::usleep(20 * 1000);
    }
    return !process_running(pid);
}

int main() {
    set_log_level(LogLevel::WARN);

    // 1) stdout, environment and cwd of the child; exit observed exactly once
    {
        std::atomic<int> calls{0};
        std::atomic<int> code{-1};
        LaunchSpec spec = sh_spec("echo \"$GREETING $(pwd)\"; exit 5");
        spec.env["GREETING"] = "hello";
        auto cp = ChildProcess::spawn(spec, [&](int c) { calls++; code = c; }, "test");
        expect_true(cp->pid() > 0, "pid assigned");

        int out_fd = cp->take_stdout_fd();
        expect_true(out_fd >= 0, "stdout fd handed out");
        expect_eq_ll(cp->take_stdout_fd(), -1, "stdout fd taken only once");
        std::string out = read_all(out_fd);
        ::close(out_fd);
        expect_eq_str(out, "hello /tmp\n", "child stdout");

        expect_true(cp->wait_for_exit(5000), "child should exit");
        expect_eq_ll(cp->exit_code(), 5, "exit code");
        cp.reset();  // joins the watcher
        expect_eq_ll(calls.load(), 1, "exit callback fires once");
        expect_eq_ll(code.load(), 5, "callback sees exit code");
    }

    // 2) exec failure is a launch error, not a dead session
    {
        LaunchSpec spec = sh_spec("");
        spec.command = "/nonexistent/interpreter";
        bool threw = false;
        try {
            ChildProcess::spawn(spec, nullptr, "test");
        } catch (const ForgeError& e) {
            threw = e.kind() == ErrorKind::LAUNCH_FAILED;
            expect_true(contains(e.what(), "launch failed"), std::string("message: ") + e.what());
        }
        expect_true(threw, "missing interpreter should throw LaunchFailed");
    }

    // 3) unusable working directory
    {
        LaunchSpec spec = sh_spec("exit 0");
        spec.cwd = "/nonexistent/workdir";
        bool threw = false;
        try {
            ChildProcess::spawn(spec, nullptr, "test");
        } catch (const ForgeError& e) {
            threw = e.kind() == ErrorKind::LAUNCH_FAILED;
        }
        expect_true(threw, "bad cwd should throw LaunchFailed");
    }

    // 4) terminate: SIGTERM is enough for a cooperative child
    {
        auto cp = ChildProcess::spawn(sh_spec("exec sleep 30"), nullptr, "test");
        cp->terminate(2000);
        expect_true(cp->wait_for_exit(5000), "terminated child reaped");
        expect_eq_ll(cp->exit_code(), 128 + SIGTERM, "killed by SIGTERM");
        cp->terminate(2000);  // idempotent
    }

    // 5) terminate escalates to SIGKILL after the grace period
    {
        auto cp = ChildProcess::spawn(sh_spec("trap '' TERM; while true; do sleep 1; done"), nullptr, "test");
        ::usleep(200 * 1000);  // let the shell install its trap
        cp->terminate(300);
        expect_true(cp->wait_for_exit(5000), "stubborn child reaped");
        expect_eq_ll(cp->exit_code(), 128 + SIGKILL, "killed by SIGKILL");
    }

    // 6) destructor force-terminates a live child
    {
        int pid = -1;
        {
            auto cp = ChildProcess::spawn(sh_spec("exec sleep 30"), nullptr, "test");
            pid = cp->pid();
        }
        expect_true(::kill(pid, 0) != 0, "child gone after destructor");
    }

    // 7) stderr is drained without blocking the child
    {
        auto cp = ChildProcess::spawn(sh_spec("i=0; while [ $i -lt 2000 ]; do echo noise-$i 1>&2; i=$((i+1)); done"),
                                      nullptr, "test");
        expect_true(cp->wait_for_exit(10000), "noisy child finishes");
        expect_eq_ll(cp->exit_code(), 0, "noisy child exit code");
    }

    // 8) a grandchild that ignores SIGTERM dies with the group once the leader is reaped
    {
        auto cp = ChildProcess::spawn(sh_spec("(trap '' TERM; exec sleep 30) & echo $!; wait"), nullptr, "test");
        int out_fd = cp->take_stdout_fd();
        int grandchild = std::atoi(read_line(out_fd).c_str());
        ::close(out_fd);
        expect_true(grandchild > 0, "grandchild pid reported");
        expect_true(process_running(grandchild), "grandchild running before terminate");

        ::usleep(200 * 1000);  // let the subshell install its trap
        cp->terminate(2000);
        expect_true(cp->wait_for_exit(5000), "leader reaped");
        expect_eq_ll(cp->exit_code(), 128 + SIGTERM, "leader obeyed SIGTERM");
        expect_true(wait_not_running(grandchild, 3000), "grandchild killed with the group");
    }

    std::cerr << "test_launcher: ALL PASSED" << std::endl;
    return 0;
}
