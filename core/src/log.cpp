#include "mcpforge/log.h"
#include "mcpforge/config.h"

#include <json-c/json.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mcpforge {

namespace {

std::mutex g_log_mu;
std::atomic<int> g_level{-1};

const char* level_tag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

} // namespace

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

LogLevel parse_log_level(const std::string& s, LogLevel defv) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return defv;
}

void set_log_level(LogLevel lvl) {
    g_level.store((int)lvl);
}

LogLevel log_level() {
    int v = g_level.load();
    if (v < 0) {
        LogLevel lvl = parse_log_level(getenv_str("MCPFORGE_LOG_LEVEL", "info"), LogLevel::INFO);
        g_level.store((int)lvl);
        return lvl;
    }
    return (LogLevel)v;
}

void log_write(LogLevel lvl, const std::string& component, const std::string& msg) {
    if ((int)lvl < (int)log_level()) return;
    std::string line = iso_now() + " " + level_tag(lvl) + " [" + component + "] " + msg;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << line << "\n";
    std::cerr.flush();
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    out_.open(path_, std::ios::out | std::ios::app);
    enabled_ = out_.is_open();
    if (!enabled_) {
        log_warn("eventlog", "cannot open event log " + path_ + ", events disabled");
    }
}

void EventLog::event(const std::string& name, const std::string& payload_json) {
    if (!enabled_) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::string line = json_object_to_json_string_ext(rec, JSON_C_TO_STRING_PLAIN);
    json_object_put(rec);

    std::lock_guard<std::mutex> lk(mu_);
    out_ << line << "\n";
    out_.flush();
}

} // namespace mcpforge
