#include "test_common.h"

#include "mcpforge/errors.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/launcher.h"
#include "mcpforge/log.h"
#include "mcpforge/mcp_client.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace mcpforge;
namespace fs = std::filesystem;

namespace {

std::string g_worker;
fs::path g_tmp;

struct Worker {
    std::unique_ptr<ChildProcess> proc;
    std::unique_ptr<McpClient> client;

    Worker() = default;
    Worker(Worker&&) = default;
    ~Worker() {
        if (client) client->close();
        if (proc) proc->terminate(200);
    }
};

Worker start(const std::string& name, const std::string& script, int handshake_ms = 5000, int request_ms = 5000) {
    fs::path p = g_tmp / (name + ".script");
    std::ofstream(p) << script;

    LaunchSpec spec;
    spec.command = g_worker;
    spec.args = {p.string()};
    spec.cwd = g_tmp.string();
    spec.env = {{"PATH", "/usr/bin:/bin"}, {"MCPFORGE_TEST_VAR", "visible"}};

    Worker w;
    w.proc = ChildProcess::spawn(spec, nullptr, name);
    McpClient::Options opt;
    opt.handshake_timeout_ms = handshake_ms;
    opt.request_timeout_ms = request_ms;
    opt.log_tag = name;
    int to_child = w.proc->take_stdin_fd();
    int from_child = w.proc->take_stdout_fd();
    w.client = std::make_unique<McpClient>(to_child, from_child, opt);
    return w;
}

std::string first_text(const std::string& result_json) {
    json_mini::Doc d = json_mini::parse(result_json);
    json_object* content = json_mini::get(d.root, "content");
    if (!content || !json_object_is_type(content, json_type_array) || json_object_array_length(content) == 0) {
        return "";
    }
    return json_mini::get_string(json_object_array_get_idx(content, 0), "text").value_or("");
}

ErrorKind kind_of(const std::function<void()>& fn, bool* threw) {
    *threw = false;
    try {
        fn();
    } catch (const ForgeError& e) {
        *threw = true;
        return e.kind();
    }
    return ErrorKind::INTERNAL_CLEANUP_ERROR;
}

} // namespace

int main(int argc, char** argv) {
    expect_true(argc >= 2, "usage: test_mcp_client <fake_mcp_worker>");
    g_worker = fs::absolute(argv[1]).string();
    expect_true(fs::exists(g_worker), "worker binary not found: " + g_worker);
    set_log_level(LogLevel::WARN);

    g_tmp = fs::temp_directory_path() / ("mcpforge-client-" + std::to_string(::getpid()));
    fs::create_directories(g_tmp);

    // 1) handshake, listing, echo call
    {
        Worker w = start("basic", "server-name echo-srv\ntool echo Echoes\ntool add Adds numbers\n");
        w.client->connect();
        expect_eq_str(w.client->server_name(), "echo-srv", "serverInfo.name recorded");

        auto tools = w.client->list_tools();
        expect_eq_ll((long long)tools.size(), 2, "two tools");
        expect_eq_str(tools[0].name, "echo", "first tool");
        expect_eq_str(tools[1].description, "Adds numbers", "description");
        expect_true(contains(tools[0].input_schema_json, "\"message\""), "schema captured");

        std::string r = w.client->call_tool("echo", "{\"message\":\"hi\"}");
        expect_eq_str(first_text(r), "Echo: hi", "echo result");

        std::string r2 = w.client->call_tool("add", "");
        expect_eq_str(first_text(r2), "called add with {}", "empty args sent as {}");
    }

    // 2) pagination is followed to the end
    {
        Worker w = start("paged", "page-size 2\ntool a\ntool b\ntool c\ntool d\ntool e\n");
        w.client->connect();
        auto tools = w.client->list_tools();
        expect_eq_ll((long long)tools.size(), 5, "all pages collected");
        expect_eq_str(tools[4].name, "e", "page order kept");
    }

    // 3) error reply vs isError result
    {
        Worker w = start("errors", "tool boom\ntool fine\nerror-on boom\n");
        w.client->connect();
        bool threw = false;
        std::string detail;
        try {
            w.client->call_tool("boom", "{}");
        } catch (const ForgeError& e) {
            threw = e.kind() == ErrorKind::TOOL_INVOCATION_FAILED;
            detail = e.detail();
            expect_eq_str(e.what(), "tool boom failed", "error message from the worker");
        }
        expect_true(threw, "JSON-RPC error surfaces as ToolInvocationFailed");
        expect_true(contains(detail, "-32000"), "error object kept as detail: " + detail);

        std::string r = w.client->call_tool("missing", "{}");
        expect_true(contains(r, "\"isError\":true"), "isError result passed through: " + r);

        bool bad_args = false;
        kind_of([&] { w.client->call_tool("fine", "[1,2]"); }, &bad_args);
        expect_true(bad_args, "non-object arguments rejected");

        // still usable after failures
        expect_true(contains(w.client->call_tool("fine", "{\"x\":1}"), "called fine"), "client still usable");
    }

    // 4) concurrent calls are correlated by id
    {
        Worker w = start("concurrent", "tool echo\ntool slow\nsleep-on slow 300\n");
        w.client->connect();
        std::atomic<int> ok{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&, i] {
                std::string msg = "m" + std::to_string(i);
                std::string r = w.client->call_tool("echo", "{\"message\":\"" + msg + "\"}");
                if (first_text(r) == "Echo: " + msg) ok++;
            });
        }
        ts.emplace_back([&] {
            if (contains(w.client->call_tool("slow", "{}"), "called slow")) ok++;
        });
        for (auto& t : ts) t.join();
        expect_eq_ll(ok.load(), 9, "every concurrent call got its own reply");
    }

    // 5) worker exits before the handshake
    {
        Worker w = start("early-exit", "exit-before-handshake 3\n");
        bool threw = false;
        ErrorKind k = kind_of([&] { w.client->connect(); }, &threw);
        expect_true(threw && k == ErrorKind::HANDSHAKE_FAILED, "early exit is a handshake failure");
    }

    // 6) worker never answers initialize
    {
        Worker w = start("silent", "ignore-initialize\n", 300);
        auto t0 = std::chrono::steady_clock::now();
        bool threw = false;
        ErrorKind k = kind_of([&] { w.client->connect(); }, &threw);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(threw && k == ErrorKind::HANDSHAKE_FAILED, "silent worker times out");
        expect_true(ms < 5000, "handshake timeout honored");
    }

    // 7) worker dies during a call: pending request fails instead of hanging
    {
        Worker w = start("dies", "tool die\nexit-on die 9\n", 5000, 0);
        w.client->connect();
        bool threw = false;
        ErrorKind k = kind_of([&] { w.client->call_tool("die", "{}"); }, &threw);
        expect_true(threw && k == ErrorKind::TOOL_INVOCATION_FAILED, "call to dying worker fails");
        expect_true(!w.client->is_open(), "client closed after EOF");

        bool again = false;
        kind_of([&] { w.client->list_tools(); }, &again);
        expect_true(again, "requests after close fail fast");
    }

    // 8) server-initiated ping is answered
    {
        Worker w = start("pinger", "ping-client\ntool pinged\n");
        w.client->connect();
        std::string text;
        for (int i = 0; i < 50 && text != "pong"; i++) {
            text = first_text(w.client->call_tool("pinged", "{}"));
            if (text != "pong") std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        expect_eq_str(text, "pong", "client answered the worker ping");
    }

    // 9) close unblocks and is idempotent
    {
        Worker w = start("closer", "tool slow\nsleep-on slow 3000\n", 5000, 0);
        w.client->connect();
        std::atomic<bool> failed{false};
        std::thread t([&] {
            bool threw = false;
            kind_of([&] { w.client->call_tool("slow", "{}"); }, &threw);
            failed = threw;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        w.client->close();
        t.join();
        expect_true(failed.load(), "in-flight call fails on close");
        w.client->close();
        expect_true(!w.client->is_open(), "closed");
    }

    std::error_code ec;
    fs::remove_all(g_tmp, ec);
    std::cerr << "test_mcp_client: ALL PASSED" << std::endl;
    return 0;
}
