#pragma once

#include "types.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpforge {

// A long-lived worker process with three pipes.
//
// - stdin/stdout are handed to the protocol client via take_stdin_fd/take_stdout_fd
// - stderr is drained by a thread into the logger, one line per record
// - a watcher thread reaps the child, kills what is left of its process group
//   and fires on_exit exactly once
//
// The destructor force-terminates the process group and joins both threads.
class ChildProcess {
public:
    // exit_code: WEXITSTATUS, or 128 + signal number.
    using ExitCallback = std::function<void(int exit_code)>;

    // Throws ForgeError(LAUNCH_FAILED) when pipes cannot be created, fork fails,
    // the working directory is unusable or exec fails.
    static std::unique_ptr<ChildProcess> spawn(const LaunchSpec& spec,
                                               ExitCallback on_exit,
                                               const std::string& log_tag);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int pid() const { return pid_; }

    // Ownership of the fd moves to the caller. Returns -1 if already taken.
    int take_stdin_fd();
    int take_stdout_fd();

    bool exited() const;
    int exit_code() const;  // -1 while running

    // SIGTERM to the process group, wait up to grace_ms, then SIGKILL.
    // Idempotent; a no-op once the child has been reaped. Processes left in
    // the group after the leader is reaped get SIGKILL from the watcher.
    void terminate(int grace_ms);

    // Block until the exit observer has fired. timeout_ms <= 0 waits forever.
    bool wait_for_exit(int timeout_ms);

private:
    ChildProcess() = default;

    void watch_loop();
    void drain_stderr_loop();

    int pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    std::string log_tag_;
    ExitCallback on_exit_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool exited_{false};
    int exit_code_{-1};

    std::atomic<bool> stop_drain_{false};
    std::thread watcher_;
    std::thread drainer_;
};

} // namespace mcpforge
