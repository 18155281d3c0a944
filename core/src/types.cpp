#include "mcpforge/types.h"

namespace mcpforge {

std::optional<Language> parse_language(const std::string& s) {
    if (s == "typescript") return Language::TYPESCRIPT;
    if (s == "javascript") return Language::JAVASCRIPT;
    if (s == "python") return Language::PYTHON;
    return std::nullopt;
}

const char* language_name(Language lang) {
    switch (lang) {
        case Language::TYPESCRIPT: return "typescript";
        case Language::JAVASCRIPT: return "javascript";
        case Language::PYTHON:     return "python";
    }
    return "javascript";
}

const char* session_status_name(SessionStatus st) {
    switch (st) {
        case SessionStatus::CREATING:   return "creating";
        case SessionStatus::RUNNING:    return "running";
        case SessionStatus::TERMINATED: return "terminated";
    }
    return "running";
}

} // namespace mcpforge
