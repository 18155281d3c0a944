#include "mcpforge/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace mcpforge {

Profile detect_profile() {
    const char* env = std::getenv("MCPFORGE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("MCPFORGE_LOG_LEVEL",          "debug", NO_OVERWRITE);
            setenv("MCPFORGE_TERMINATE_GRACE_MS", "500",   NO_OVERWRITE);
            setenv("MCPFORGE_SERVE_WORKERS",      "4",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("MCPFORGE_LOG_LEVEL",          "info",  NO_OVERWRITE);
            setenv("MCPFORGE_TERMINATE_GRACE_MS", "2000",  NO_OVERWRITE);
            setenv("MCPFORGE_SERVE_WORKERS",      "8",     NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return std::string(v);
}

ForgeConfig ForgeConfig::from_env() {
    ForgeConfig c;
    std::string tmp;
    {
        std::error_code ec;
        auto t = std::filesystem::temp_directory_path(ec);
        tmp = ec ? std::string("/tmp") : t.string();
    }
    c.servers_dir = getenv_str("MCPFORGE_SERVERS_DIR",
                               (std::filesystem::path(tmp) / "mcp-create-servers").string());
    c.shared_node_modules = getenv_str("MCPFORGE_SHARED_NODE_MODULES", c.shared_node_modules);
    c.app_package_json = getenv_str("MCPFORGE_APP_PACKAGE_JSON", c.app_package_json);

    c.node_bin = getenv_str("MCPFORGE_NODE_BIN", c.node_bin);
    c.npx_bin = getenv_str("MCPFORGE_NPX_BIN", c.npx_bin);
    c.npm_bin = getenv_str("MCPFORGE_NPM_BIN", c.npm_bin);
    c.python_bin = getenv_str("MCPFORGE_PYTHON_BIN", c.python_bin);
    c.pip_bin = getenv_str("MCPFORGE_PIP_BIN", c.pip_bin);

    c.build_timeout_ms = std::max(0, getenv_int("MCPFORGE_BUILD_TIMEOUT_MS", c.build_timeout_ms));
    c.handshake_timeout_ms = std::max(1, getenv_int("MCPFORGE_HANDSHAKE_TIMEOUT_MS", c.handshake_timeout_ms));
    c.request_timeout_ms = std::max(0, getenv_int("MCPFORGE_REQUEST_TIMEOUT_MS", c.request_timeout_ms));
    c.terminate_grace_ms = std::max(0, getenv_int("MCPFORGE_TERMINATE_GRACE_MS", c.terminate_grace_ms));
    c.event_log_path = getenv_str("MCPFORGE_EVENT_LOG", "");
    return c;
}

} // namespace mcpforge
