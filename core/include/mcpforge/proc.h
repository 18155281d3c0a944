#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcpforge {

struct ProcLimits {
    int timeout_ms{0};                    // 0 = wait for the child indefinitely
    size_t output_max_bytes{1024 * 1024}; // per stream
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string out;    // child stdout
    std::string err;    // child stderr
    std::string error;  // internal runner error, not child stderr
};

// Extra variables layered over the parent environment in the child.
using ProcEnv = std::map<std::string, std::string>;

// Run argv (argv[0] resolved through PATH), capture stdout and stderr separately,
// enforce timeout by killing the process group. Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcEnv& env,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same as proc_run_capture, feeding stdin_data to the child and closing its stdin.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const ProcEnv& env,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Absolute path of an executable found in the fixed system directories
// (/usr/local/bin, /usr/bin, /bin, /usr/local/sbin, /usr/sbin, /sbin).
// Names containing '/' are returned unchanged; unresolved names fall back to the bare name.
std::string resolve_command_path(const std::string& cmd);

// Last max_bytes of s, cut at a line start when possible.
std::string tail_excerpt(const std::string& s, size_t max_bytes = 4096);

// Split a command string into argv tokens (single/double quotes, backslash in double quotes).
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace mcpforge
