#pragma once

#include <stdexcept>
#include <string>

namespace mcpforge {

enum class ErrorKind {
    UNSUPPORTED_LANGUAGE,
    BUILD_FAILED,
    DEPENDENCY_INSTALL_FAILED,
    LAUNCH_FAILED,
    HANDSHAKE_FAILED,
    NOT_FOUND,
    TOOL_INVOCATION_FAILED,
    INTERNAL_CLEANUP_ERROR,  // logged only, never thrown out of a public operation
};

const char* error_kind_name(ErrorKind k);

// Single exception type for every core failure.
// - exit_code: build / install subprocess exit code (-1 when not applicable)
// - detail: stderr excerpt for build failures, verbatim failure payload for
//   tool invocations, empty otherwise
class ForgeError : public std::runtime_error {
public:
    ForgeError(ErrorKind kind, const std::string& message,
               int exit_code = -1, std::string detail = {});

    ErrorKind kind() const { return kind_; }
    int exit_code() const { return exit_code_; }
    const std::string& detail() const { return detail_; }

    static ForgeError unsupported_language(const std::string& lang);
    static ForgeError build_failed(int exit_code, const std::string& stderr_excerpt);
    static ForgeError dependency_install_failed(const std::string& manager, int exit_code,
                                                const std::string& stderr_excerpt);
    static ForgeError launch_failed(const std::string& why);
    static ForgeError handshake_failed(const std::string& why);
    static ForgeError not_found(const std::string& id);
    static ForgeError tool_invocation_failed(const std::string& why, const std::string& payload_json);

private:
    ErrorKind kind_;
    int exit_code_;
    std::string detail_;
};

} // namespace mcpforge
