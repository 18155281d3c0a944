#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpforge {

// Session identifier: UUIDv4 text, never reused within a process lifetime.
using SessionId = std::string;

enum class Language {
    TYPESCRIPT,
    JAVASCRIPT,
    PYTHON,
};

// "typescript" / "javascript" / "python" (case-sensitive, as received on the wire)
std::optional<Language> parse_language(const std::string& s);
const char* language_name(Language lang);

// Creating never appears in the registry; Terminated means the entry is gone.
enum class SessionStatus {
    CREATING,
    RUNNING,
    TERMINATED,
};

const char* session_status_name(SessionStatus st);

// Package name -> version constraint. Passed through to the package manager untouched.
using DependencyManifest = std::map<std::string, std::string>;

// Tool descriptor as reported by a worker. raw_json keeps the exact object the
// worker sent so it can be passed upstream without re-shaping.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string input_schema_json{"{}"};
    std::string raw_json{"{}"};
};

// Fully resolved launch triple for a worker.
struct LaunchSpec {
    std::string command;                       // absolute when resolvable
    std::vector<std::string> args;
    std::string cwd;
    std::map<std::string, std::string> env;    // complete environment of the child
};

// Diagnostic snapshot of a live session.
struct SessionInfo {
    SessionId id;
    Language language{Language::JAVASCRIPT};
    std::string working_dir;
    int pid{-1};
    SessionStatus status{SessionStatus::RUNNING};
};

} // namespace mcpforge
