#include "mcpforge/errors.h"

#include <utility>

namespace mcpforge {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::UNSUPPORTED_LANGUAGE:      return "UnsupportedLanguage";
        case ErrorKind::BUILD_FAILED:              return "BuildFailed";
        case ErrorKind::DEPENDENCY_INSTALL_FAILED: return "DependencyInstallFailed";
        case ErrorKind::LAUNCH_FAILED:             return "LaunchFailed";
        case ErrorKind::HANDSHAKE_FAILED:          return "HandshakeFailed";
        case ErrorKind::NOT_FOUND:                 return "NotFound";
        case ErrorKind::TOOL_INVOCATION_FAILED:    return "ToolInvocationFailed";
        case ErrorKind::INTERNAL_CLEANUP_ERROR:    return "InternalCleanupError";
    }
    return "Unknown";
}

ForgeError::ForgeError(ErrorKind kind, const std::string& message, int exit_code, std::string detail)
    : std::runtime_error(message), kind_(kind), exit_code_(exit_code), detail_(std::move(detail)) {}

ForgeError ForgeError::unsupported_language(const std::string& lang) {
    return ForgeError(ErrorKind::UNSUPPORTED_LANGUAGE, "Unsupported language: " + lang);
}

ForgeError ForgeError::build_failed(int exit_code, const std::string& stderr_excerpt) {
    return ForgeError(ErrorKind::BUILD_FAILED,
                      "TypeScript compilation failed with code " + std::to_string(exit_code),
                      exit_code, stderr_excerpt);
}

ForgeError ForgeError::dependency_install_failed(const std::string& manager, int exit_code,
                                                 const std::string& stderr_excerpt) {
    return ForgeError(ErrorKind::DEPENDENCY_INSTALL_FAILED,
                      manager + " install failed with code " + std::to_string(exit_code),
                      exit_code, stderr_excerpt);
}

ForgeError ForgeError::launch_failed(const std::string& why) {
    return ForgeError(ErrorKind::LAUNCH_FAILED, "launch failed: " + why);
}

ForgeError ForgeError::handshake_failed(const std::string& why) {
    return ForgeError(ErrorKind::HANDSHAKE_FAILED, "handshake failed: " + why);
}

ForgeError ForgeError::not_found(const std::string& id) {
    return ForgeError(ErrorKind::NOT_FOUND, "Server " + id + " not found");
}

ForgeError ForgeError::tool_invocation_failed(const std::string& why, const std::string& payload_json) {
    return ForgeError(ErrorKind::TOOL_INVOCATION_FAILED, why, -1, payload_json);
}

} // namespace mcpforge
