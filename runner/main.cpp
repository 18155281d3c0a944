#include "cmd_http.h"
#include "cmd_stdio.h"

#include "mcpforge/config.h"
#include "mcpforge/log.h"

#include <iostream>
#include <string>

static void usage() {
    std::cerr << "mcpforge <stdio|http> ...\n"
                 "  stdio   MCP server on stdin/stdout (create / execute / update / delete workers)\n"
                 "  http    HTTP façade: GET /health, POST /api/mcp\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }

    // Must run before any thread starts.
    mcpforge::Profile profile = mcpforge::detect_profile();
    mcpforge::apply_profile_defaults(profile);
    mcpforge::log_debug("main", std::string("profile ") + mcpforge::profile_name(profile));

    std::string cmd = argv[1];
    if (cmd == "stdio") return cmd_stdio(argc, argv);
    if (cmd == "http") return cmd_http(argc, argv);
    if (cmd == "--help" || cmd == "-h") {
        usage();
        return 0;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return 2;
}
