#include "test_common.h"

#include "mcpforge/dispatcher.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/server_manager.h"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace mcpforge;
namespace fs = std::filesystem;

namespace {

// Runs one tools/call and returns the parsed JSON inside the text block.
json_mini::Doc call(Dispatcher& d, const std::string& params_json) {
    json_mini::Doc params = json_mini::parse(params_json);
    expect_true((bool)params, "bad test params: " + params_json);
    json_mini::Doc res = json_mini::parse(d.call(params.root));
    json_object* content = json_mini::get(res.root, "content");
    expect_true(content && json_object_is_type(content, json_type_array) &&
                json_object_array_length(content) == 1, "one content block");
    json_object* item = json_object_array_get_idx(content, 0);
    expect_eq_str(json_mini::get_string(item, "type").value_or(""), "text", "text block");
    std::string text = json_mini::get_string(item, "text").value_or("");
    json_mini::Doc inner = json_mini::parse(text);
    expect_true((bool)inner, "text block holds JSON: " + text);
    return inner;
}

std::string error_of(const json_mini::Doc& d) {
    return json_mini::get_string(d.root, "error").value_or("");
}

} // namespace

int main(int argc, char** argv) {
    expect_true(argc >= 2, "usage: test_dispatcher <fake_mcp_worker>");
    std::string worker = fs::absolute(argv[1]).string();
    set_log_level(LogLevel::ERROR);

    fs::path tmp = fs::temp_directory_path() / ("mcpforge-dispatch-" + std::to_string(::getpid()));
    ForgeConfig cfg;
    cfg.servers_dir = (tmp / "servers").string();
    cfg.shared_node_modules = (tmp / "node_modules").string();
    cfg.app_package_json = (tmp / "package.json").string();
    cfg.node_bin = worker;
    cfg.npm_bin = "/bin/false";
    cfg.handshake_timeout_ms = 5000;
    cfg.request_timeout_ms = 5000;
    cfg.terminate_grace_ms = 200;

    ServerManager mgr(cfg);
    Dispatcher disp(mgr);

    // tools/list advertises the six operations
    {
        json_mini::Doc tl = json_mini::parse(disp.list_tools_result());
        json_object* tools = json_mini::get(tl.root, "tools");
        expect_eq_ll((long long)json_object_array_length(tools), 6, "six upstream tools");
        expect_eq_str(json_mini::get_string(json_object_array_get_idx(tools, 0), "name").value_or(""),
                      "create-server-from-template", "first tool");
    }

    // create with custom code
    json_mini::Doc created = call(disp,
        "{\"name\":\"create-server-from-template\",\"arguments\":{\"language\":\"javascript\","
        "\"code\":\"tool echo\\ntool add\\n\"}}");
    std::string id = json_mini::get_string(created.root, "serverId").value_or("");
    expect_true(!id.empty(), "serverId returned");
    expect_eq_str(json_mini::get_string(created.root, "message").value_or(""),
                  "Created server from custom code in javascript", "create message");

    // list-servers
    json_mini::Doc listed = call(disp, "{\"name\":\"list-servers\",\"arguments\":{}}");
    json_object* servers = json_mini::get(listed.root, "servers");
    expect_eq_ll((long long)json_object_array_length(servers), 1, "one server listed");
    expect_eq_str(json_object_get_string(json_object_array_get_idx(servers, 0)), id, "listed id");

    // get-server-tools wraps the worker's list
    json_mini::Doc tools = call(disp, "{\"name\":\"get-server-tools\",\"arguments\":{\"serverId\":\"" + id + "\"}}");
    json_object* inner = json_mini::get(json_mini::get(tools.root, "tools"), "tools");
    expect_true(inner && json_object_array_length(inner) == 2, "tools nested as {tools:{tools:[...]}}");

    // execute-tool returns the worker's raw result
    json_mini::Doc exec = call(disp,
        "{\"name\":\"execute-tool\",\"arguments\":{\"serverId\":\"" + id +
        "\",\"toolName\":\"echo\",\"args\":{\"message\":\"Hello\"}}}");
    json_object* content = json_mini::get(exec.root, "content");
    expect_eq_str(json_mini::get_string(json_object_array_get_idx(content, 0), "text").value_or(""),
                  "Echo: Hello", "raw worker result");

    json_mini::Doc no_args = call(disp,
        "{\"name\":\"execute-tool\",\"arguments\":{\"serverId\":\"" + id + "\",\"toolName\":\"add\"}}");
    expect_true(contains(json_mini::dump(no_args.root), "called add with {}"), "args default to {}");

    json_mini::Doc bad_args = call(disp,
        "{\"name\":\"execute-tool\",\"arguments\":{\"serverId\":\"" + id + "\",\"toolName\":\"add\",\"args\":[1]}}");
    expect_eq_str(error_of(bad_args), "args must be an object", "non-object args rejected");

    // update-server
    json_mini::Doc upd = call(disp,
        "{\"name\":\"update-server\",\"arguments\":{\"serverId\":\"" + id + "\",\"code\":\"tool echo\\n\"}}");
    std::string id2 = json_mini::get_string(upd.root, "serverId").value_or("");
    expect_true(json_mini::get_bool(upd.root, "success").value_or(false), "update success");
    expect_true(!id2.empty() && id2 != id, "update returns a new id");
    expect_eq_str(json_mini::get_string(upd.root, "message").value_or(""),
                  "Server " + id + " updated and restarted as " + id2, "update message");

    // old id is gone
    json_mini::Doc stale = call(disp, "{\"name\":\"get-server-tools\",\"arguments\":{\"serverId\":\"" + id + "\"}}");
    expect_eq_str(error_of(stale), "Server " + id + " not found", "stale id error envelope");

    // delete-server
    json_mini::Doc del = call(disp, "{\"name\":\"delete-server\",\"arguments\":{\"serverId\":\"" + id2 + "\"}}");
    expect_eq_str(json_mini::get_string(del.root, "message").value_or(""), "Server " + id2 + " deleted",
                  "delete message");
    json_mini::Doc del2 = call(disp, "{\"name\":\"delete-server\",\"arguments\":{\"serverId\":\"" + id2 + "\"}}");
    expect_eq_str(error_of(del2), "Server " + id2 + " not found", "second delete not found");

    // error envelopes
    expect_eq_str(error_of(call(disp, "{\"name\":\"list-servers\"}")), "No arguments provided", "missing arguments");
    expect_eq_str(error_of(call(disp, "{\"name\":\"frobnicate\",\"arguments\":{}}")),
                  "Unknown tool: frobnicate", "unknown tool");
    expect_eq_str(error_of(call(disp,
        "{\"name\":\"create-server-from-template\",\"arguments\":{\"language\":\"ruby\"}}")),
                  "Unsupported language: ruby", "unsupported language");
    expect_eq_str(error_of(call(disp, "{\"name\":\"create-server-from-template\",\"arguments\":{}}")),
                  "Missing required argument: language", "missing language");
    expect_eq_str(error_of(call(disp,
        "{\"name\":\"create-server-from-template\",\"arguments\":{\"language\":\"javascript\","
        "\"code\":\"tool x\\n\",\"dependencies\":{\"axios\":\"^1.6.0\"}}}")),
                  "npm install failed with code 1", "install failure surfaces in the envelope");
    expect_eq_str(error_of(call(disp,
        "{\"name\":\"create-server-from-template\",\"arguments\":{\"language\":\"javascript\","
        "\"code\":\"exit-before-handshake 2\\n\"}}")).substr(0, 17),
                  "handshake failed:", "handshake failure surfaces in the envelope");

    // compiler output reaches the caller with the build failure
    {
        ForgeConfig ts_cfg = cfg;
        ts_cfg.servers_dir = (tmp / "ts-servers").string();
        fs::create_directories(tmp / "bin");
        ts_cfg.npx_bin = (tmp / "bin" / "npx").string();
        {
            std::ofstream f(ts_cfg.npx_bin);
            f << "#!/bin/sh\necho \"index.ts(1,7): error TS2322: Type 'string' is not assignable to type 'number'.\"\nexit 2\n";
        }
        fs::permissions(ts_cfg.npx_bin, fs::perms::owner_all);

        ServerManager ts_mgr(ts_cfg);
        Dispatcher ts_disp(ts_mgr);
        std::string err = error_of(call(ts_disp,
            "{\"name\":\"create-server-from-template\",\"arguments\":{\"language\":\"typescript\","
            "\"code\":\"const x: number = 'a';\"}}"));
        expect_eq_str(err.substr(0, 41), "TypeScript compilation failed with code 2", "build failure message: " + err);
        expect_true(contains(err, "error TS2322"), "compiler output in the envelope: " + err);
    }

    json_mini::Doc empty = call(disp, "{\"name\":\"list-servers\",\"arguments\":{}}");
    expect_eq_ll((long long)json_object_array_length(json_mini::get(empty.root, "servers")), 0, "nothing left");

    mgr.shutdown_all();
    std::error_code ec;
    fs::remove_all(tmp, ec);
    std::cerr << "test_dispatcher: ALL PASSED" << std::endl;
    return 0;
}
