#include "cmd_http.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "mcpforge/config.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/proc.h"
#include "mcpforge/serialization.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <vector>

#include <poll.h>

using namespace mcpforge;

namespace {

struct HttpSettings {
    std::vector<std::string> server_cmd;  // argv of the per-request stdio server
    size_t max_body_bytes{2 * 1024 * 1024};
    int request_timeout_ms{0};
};

void handle_mcp_post(int cfd, const std::string& body, const HttpSettings& hs) {
    // Re-serialize so the request reaches the server as exactly one line.
    std::string request_line = "{}";
    if (body.find_first_not_of(" \t\r\n") != std::string::npos) {
        json_mini::Doc d = json_mini::parse(body);
        if (!d) {
            send_json(cfd, 400, error_payload("invalid JSON body"));
            return;
        }
        request_line = json_mini::dump(d.root);
    }

    ProcLimits lim;
    lim.timeout_ms = hs.request_timeout_ms;
    lim.output_max_bytes = 16 * 1024 * 1024;
    ProcResult r;
    if (!proc_run_capture_stdin(hs.server_cmd, "", ProcEnv{}, request_line + "\n", lim, &r)) {
        log_error("http", "cannot start MCP process: " + r.error);
        send_json(cfd, 500, error_payload(r.error));
        return;
    }
    if (!r.err.empty()) log_debug("http", "MCP stderr: " + tail_excerpt(r.err, 2048));

    if (r.exit_code != 0) {
        log_error("http", "MCP process exited with code " + std::to_string(r.exit_code));
        std::string j = "{\"error\":\"MCP process failed\",\"details\":" + json_quote(r.err) +
                        ",\"code\":" + std::to_string(r.exit_code) + "}";
        send_json(cfd, 500, j);
        return;
    }

    json_mini::Doc resp = json_mini::parse(r.out);
    if (resp) {
        send_json(cfd, 200, json_mini::dump(resp.root));
    } else {
        send_text(cfd, 200, r.out);
    }
}

void handle_connection(int cfd, const HttpSettings& hs) {
    std::string head, body;
    if (!read_http_request(cfd, head, body, hs.max_body_bytes)) {
        ::close(cfd);
        return;
    }

    std::istringstream iss(head);
    std::string method, target, ver;
    iss >> method >> target >> ver;
    std::string path = target.substr(0, target.find('?'));

    log_debug("http", method + " " + path);

    if (method == "GET" && path == "/health") {
        send_json(cfd, 200, "{\"status\":\"ok\",\"message\":\"MCP Server is running\"}");
    } else if (method == "POST" && path == "/api/mcp") {
        handle_mcp_post(cfd, body, hs);
    } else {
        send_json(cfd, 404, "{\"error\":\"Not found\",\"path\":" + json_quote(path) + "}");
    }
    ::close(cfd);
}

} // namespace

int cmd_http(int argc, char** argv) {
    std::string host = getenv_str("MCPFORGE_HTTP_HOST", "0.0.0.0");
    int port = env_port(8080);

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port = std::atoi(argv[++i]); continue; }
        if (a == "--help" || a == "-h") {
            std::cerr << "usage: mcpforge http [--host H] [--port P]\n"
                         "  GET /health, POST /api/mcp (one stdio server process per request)\n";
            return 0;
        }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }

    HttpSettings hs;
    std::string cmd = getenv_str("MCPFORGE_SERVER_CMD", "");
    if (!cmd.empty()) {
        hs.server_cmd = split_argv_quoted(cmd);
        if (hs.server_cmd.empty()) {
            std::cerr << "MCPFORGE_SERVER_CMD: cannot parse '" << cmd << "'\n";
            return 2;
        }
    } else {
        hs.server_cmd = {self_exe_path(argv[0]), "stdio"};
    }
    hs.max_body_bytes = (size_t)std::max(1024, getenv_int("MCPFORGE_HTTP_MAX_BODY_BYTES", 2 * 1024 * 1024));
    hs.request_timeout_ms = std::max(0, getenv_int("MCPFORGE_HTTP_REQUEST_TIMEOUT_MS", 0));

    install_stop_handlers();

    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed: " << std::strerror(errno) << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    log_info("http", "MCP HTTP Server running on " + host + ":" + std::to_string(port));

    constexpr size_t max_http_conns = 32;
    ConnectionThreads conns;

    while (!stop_requested()) {
        conns.reap_finished();

        struct pollfd pfd;
        pfd.fd = sfd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, 250);
        if (pr <= 0) continue;

        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        conns.reap_finished();
        if (conns.size() >= max_http_conns) {
            send_json(cfd, 503, error_payload("too many connections"));
            ::close(cfd);
            continue;
        }
        set_socket_timeouts(cfd, 10);
        conns.spawn([cfd, &hs] { handle_connection(cfd, hs); });
    }

    log_info("http", "shutting down");
    conns.join_all();
    ::close(sfd);
    return 0;
}
