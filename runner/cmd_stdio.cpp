#include "cmd_stdio.h"
#include "runner_utils.h"

#include "mcpforge/config.h"
#include "mcpforge/cpq.h"
#include "mcpforge/dispatcher.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/mcp_client.h"
#include "mcpforge/serialization.h"
#include "mcpforge/server_manager.h"

#include <cerrno>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace mcpforge;

namespace {

constexpr const char* kServerName = "MCP Create Server";
constexpr const char* kServerVersion = "1.0.0";

// Lower value runs first: cheap protocol traffic ahead of tool calls.
constexpr int32_t PRIO_CONTROL = 0;
constexpr int32_t PRIO_CALL = 10;

struct Job {
    std::string id_json;
    std::string method;
    std::string params_json;
};

class StdoutWriter {
public:
    void line(const std::string& s) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!write_all(STDOUT_FILENO, s + "\n")) {
            log_warn("stdio", "stdout closed, dropping reply");
        }
    }

    void result(const std::string& id_json, const std::string& result_json) {
        line("{\"jsonrpc\":\"2.0\",\"id\":" + id_json + ",\"result\":" + result_json + "}");
    }

    void error(const std::string& id_json, int code, const std::string& message) {
        line("{\"jsonrpc\":\"2.0\",\"id\":" + id_json + ",\"error\":{\"code\":" +
             std::to_string(code) + ",\"message\":" + json_quote(message) + "}}");
    }

private:
    std::mutex mu_;
};

std::string initialize_result(json_object* params) {
    std::string version = json_mini::get_string(params, "protocolVersion")
                              .value_or(McpClient::kProtocolVersion);
    return "{\"protocolVersion\":" + json_quote(version) +
           ",\"capabilities\":{\"tools\":{}}" +
           ",\"serverInfo\":{\"name\":" + json_quote(kServerName) +
           ",\"version\":" + json_quote(kServerVersion) + "}}";
}

void run_job(const Job& job, Dispatcher& disp, StdoutWriter& out) {
    try {
        if (job.method == "tools/list") {
            out.result(job.id_json, disp.list_tools_result());
            return;
        }
        if (job.method == "tools/call") {
            json_mini::Doc params = json_mini::parse(job.params_json);
            if (!json_mini::is_object(params.root)) {
                out.error(job.id_json, -32602, "Invalid params");
                return;
            }
            out.result(job.id_json, disp.call(params.root));
            return;
        }
        out.error(job.id_json, -32601, "Method not found: " + job.method);
    } catch (const std::exception& e) {
        log_error("stdio", job.method + " failed: " + e.what());
        out.error(job.id_json, -32603, e.what());
    }
}

} // namespace

int cmd_stdio(int argc, char** argv) {
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            std::cerr << "usage: mcpforge stdio\n"
                         "  MCP server on stdin/stdout (line-delimited JSON-RPC)\n";
            return 0;
        }
    }

    install_stop_handlers();

    ForgeConfig cfg = ForgeConfig::from_env();
    int workers = getenv_int("MCPFORGE_SERVE_WORKERS", 4);
    if (workers < 1) workers = 1;
    if (workers > 64) workers = 64;

    ServerManager mgr(cfg);
    Dispatcher disp(mgr);
    StdoutWriter out;
    ConcurrentPriorityQueue<Job> jobs;

    std::vector<std::thread> pool;
    pool.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
        pool.emplace_back([&] {
            ConcurrentPriorityQueue<Job>::Item item;
            while (jobs.pop(item)) run_job(item.value, disp, out);
        });
    }

    log_info("stdio", std::string(kServerName) + " running on stdio (workers=" + std::to_string(workers) +
             ", servers_dir=" + cfg.servers_dir + ")");

    std::string buf;
    bool eof = false;
    while (!eof && !stop_requested()) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, 200);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) continue;

        char chunk[8192];
        ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) {
            eof = true;
            if (buf.empty()) break;
            buf.push_back('\n');  // last line without terminator
        } else {
            buf.append(chunk, (size_t)n);
        }

        size_t pos;
        while ((pos = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos) continue;

            json_mini::Doc msg = json_mini::parse(line);
            if (!msg) {
                out.error("null", -32700, "Parse error");
                continue;
            }
            if (!json_mini::is_object(msg.root)) {
                out.error("null", -32600, "Invalid Request");
                continue;
            }

            json_object* id = json_mini::get(msg.root, "id");
            auto method = json_mini::get_string(msg.root, "method");
            if (!method) {
                // replies to requests we never send
                if (id) log_debug("stdio", "ignoring client reply " + json_mini::dump(id));
                else out.error("null", -32600, "Invalid Request");
                continue;
            }
            if (!id) {
                log_debug("stdio", "notification " + *method);
                continue;
            }

            std::string id_json = json_mini::dump(id);
            json_object* params = json_mini::get(msg.root, "params");

            if (*method == "initialize") {
                out.result(id_json, initialize_result(params));
            } else if (*method == "ping") {
                out.result(id_json, "{}");
            } else {
                Job job{id_json, *method, params ? json_mini::dump(params) : std::string("{}")};
                int32_t prio = (*method == "tools/call") ? PRIO_CALL : PRIO_CONTROL;
                if (!jobs.push(prio, std::move(job))) {
                    out.error(id_json, -32603, "server is shutting down");
                }
            }
        }
    }

    log_info("stdio", stop_requested() ? "signal received, shutting down" : "stdin closed, shutting down");

    // In-flight and queued calls finish before the sessions go away.
    jobs.shutdown();
    for (auto& t : pool) {
        if (t.joinable()) t.join();
    }
    mgr.shutdown_all();
    return 0;
}
