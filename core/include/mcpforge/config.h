#pragma once
#include <string>

namespace mcpforge {

enum class Profile { DEV, PROD };

// Detect profile from MCPFORGE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: verbose logging, short termination grace
// PROD: info logging, longer termination grace, more serve workers
void apply_profile_defaults(Profile p);

// Runtime settings of the lifecycle core, read from MCPFORGE_* env vars.
struct ForgeConfig {
    std::string servers_dir;                          // parent of per-session working dirs
    std::string shared_node_modules{"/app/node_modules"};
    std::string app_package_json{"/app/package.json"};

    std::string node_bin{"node"};
    std::string npx_bin{"npx"};
    std::string npm_bin{"npm"};
    std::string python_bin{"python3"};
    std::string pip_bin{"pip3"};

    int build_timeout_ms{0};        // 0 = block until the compiler/package manager exits
    int handshake_timeout_ms{60000};
    int request_timeout_ms{60000};  // 0 = wait forever
    int terminate_grace_ms{500};

    std::string event_log_path;     // empty = no lifecycle event log

    std::string client_name{"mcp-create-client"};
    std::string client_version{"1.0.0"};

    static ForgeConfig from_env();
};

int getenv_int(const char* key, int defv);
std::string getenv_str(const char* key, const std::string& defv);

} // namespace mcpforge
