#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace mcpforge {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Diagnostics go to stderr only: stdout carries protocol traffic in every binary.
// Level comes from MCPFORGE_LOG_LEVEL on first use unless set explicitly.
void set_log_level(LogLevel lvl);
LogLevel log_level();
LogLevel parse_log_level(const std::string& s, LogLevel defv);

void log_write(LogLevel lvl, const std::string& component, const std::string& msg);

inline void log_debug(const std::string& c, const std::string& m) { log_write(LogLevel::DEBUG, c, m); }
inline void log_info(const std::string& c, const std::string& m)  { log_write(LogLevel::INFO, c, m); }
inline void log_warn(const std::string& c, const std::string& m)  { log_write(LogLevel::WARN, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_write(LogLevel::ERROR, c, m); }

std::string iso_now();

// Append-only JSONL record of session lifecycle events:
//   {"event":...,"payload":{...},"ts":"..."}
// Disabled (no-op) when constructed with an empty path.
class EventLog {
public:
    explicit EventLog(const std::string& path);
    void event(const std::string& name, const std::string& payload_json);
    bool enabled() const { return enabled_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool enabled_{false};
    std::mutex mu_;
    std::ofstream out_;
};

} // namespace mcpforge
