#include "mcpforge/dispatcher.h"
#include "mcpforge/errors.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/proc.h"
#include "mcpforge/serialization.h"
#include "mcpforge/templates.h"

#include <sstream>
#include <stdexcept>

namespace mcpforge {

namespace {

constexpr size_t kErrorExcerptBytes = 1024;

const char* kToolDefinitions = R"JSON({"tools":[
{"name":"create-server-from-template",
 "description":"Create a new MCP server from a template. Pass customized server code in `code`, or omit it to start the default echo server for the language.",
 "inputSchema":{"type":"object","properties":{
   "language":{"type":"string","enum":["typescript","javascript","python"],"description":"The programming language for the template"},
   "code":{"type":"string","description":"Customized server code. The default template is used when omitted."},
   "dependencies":{"type":"object","description":"Libraries and versions to install, e.g. { \"axios\": \"^1.0.0\" }"},
   "instructions":{"type":"string","description":"Free-form notes about the server. Informational only."}},
  "required":["language"]}},
{"name":"execute-tool",
 "description":"Execute a tool on a server",
 "inputSchema":{"type":"object","properties":{
   "serverId":{"type":"string","description":"The ID of the server"},
   "toolName":{"type":"string","description":"The name of the tool to execute"},
   "args":{"type":"object","description":"The arguments to pass to the tool"}},
  "required":["serverId","toolName"]}},
{"name":"get-server-tools",
 "description":"Get the tools available on a server",
 "inputSchema":{"type":"object","properties":{
   "serverId":{"type":"string","description":"The ID of the server"}},
  "required":["serverId"]}},
{"name":"update-server",
 "description":"Replace a server's code. The server restarts under a new ID, which is returned.",
 "inputSchema":{"type":"object","properties":{
   "serverId":{"type":"string","description":"The ID of the server"},
   "code":{"type":"string","description":"The new server code"}},
  "required":["serverId","code"]}},
{"name":"delete-server",
 "description":"Delete a server",
 "inputSchema":{"type":"object","properties":{
   "serverId":{"type":"string","description":"The ID of the server"}},
  "required":["serverId"]}},
{"name":"list-servers",
 "description":"List all running servers",
 "inputSchema":{"type":"object","properties":{}}}
]})JSON";

std::string text_result(const std::string& text) {
    json_mini::Doc d(text_content_result(text));
    return json_mini::dump(d.root);
}

// Missing, empty or non-string values all count as absent.
std::string req_string(json_object* args, const char* key) {
    auto v = json_mini::get_string(args, key);
    return v ? *v : std::string();
}

} // namespace

std::string Dispatcher::list_tools_result() const {
    // Re-emit compactly; the literal above is formatted for reading.
    json_mini::Doc d = json_mini::parse(kToolDefinitions);
    if (!d) throw std::logic_error("tool definitions are not valid JSON");
    return json_mini::dump(d.root);
}

std::string Dispatcher::call(json_object* params) {
    std::string name = json_mini::get_string(params, "name").value_or("");
    try {
        json_object* args = json_mini::get(params, "arguments");
        if (!json_mini::is_object(args)) {
            throw std::invalid_argument("No arguments provided");
        }
        return text_result(dispatch(name, args));
    } catch (const ForgeError& e) {
        std::string msg = e.what();
        // Build and install failures carry the tool's output; pass its tail on.
        if ((e.kind() == ErrorKind::BUILD_FAILED || e.kind() == ErrorKind::DEPENDENCY_INSTALL_FAILED) &&
            !e.detail().empty()) {
            msg += "\n" + tail_excerpt(e.detail(), kErrorExcerptBytes);
        }
        log_warn("dispatch", (name.empty() ? std::string("<unnamed>") : name) + ": " + e.what());
        return text_result(error_payload(msg));
    } catch (const std::exception& e) {
        log_warn("dispatch", (name.empty() ? std::string("<unnamed>") : name) + ": " + e.what());
        return text_result(error_payload(e.what()));
    }
}

std::string Dispatcher::dispatch(const std::string& name, json_object* args) {
    if (name == "create-server-from-template") {
        std::string language = req_string(args, "language");
        if (language.empty()) throw std::invalid_argument("Missing required argument: language");
        auto lang = parse_language(language);
        if (!lang) throw ForgeError::unsupported_language(language);

        std::string code = req_string(args, "code");
        bool custom = !code.empty();
        if (!custom) code = echo_template(*lang);

        DependencyManifest deps = manifest_from_json(json_mini::get(args, "dependencies"));
        SessionId id = mgr_.create(code, *lang, deps.empty() ? nullptr : &deps);

        std::string message = custom ? "Created server from custom code in " + language
                                     : "Created server from " + language + " template";
        return "{\"serverId\":" + json_quote(id) + ",\"message\":" + json_quote(message) + "}";
    }

    if (name == "execute-tool") {
        std::string server_id = req_string(args, "serverId");
        std::string tool = req_string(args, "toolName");
        if (server_id.empty() || tool.empty()) {
            throw std::invalid_argument("Missing required arguments: serverId and toolName");
        }
        json_object* targs = json_mini::get(args, "args");
        std::string targs_json = "{}";
        if (targs) {
            if (!json_mini::is_object(targs)) throw std::invalid_argument("args must be an object");
            targs_json = json_mini::dump(targs);
        }
        return mgr_.invoke(server_id, tool, targs_json);
    }

    if (name == "get-server-tools") {
        std::string server_id = req_string(args, "serverId");
        if (server_id.empty()) throw std::invalid_argument("Missing required argument: serverId");
        return "{\"tools\":" + tool_list_to_json(mgr_.list_tools(server_id)) + "}";
    }

    if (name == "update-server") {
        std::string server_id = req_string(args, "serverId");
        std::string code = req_string(args, "code");
        if (server_id.empty() || code.empty()) {
            throw std::invalid_argument("Missing required arguments: serverId and code");
        }
        SessionId new_id = mgr_.update(server_id, code);
        return "{\"success\":true,\"message\":" +
               json_quote("Server " + server_id + " updated and restarted as " + new_id) +
               ",\"serverId\":" + json_quote(new_id) + "}";
    }

    if (name == "delete-server") {
        std::string server_id = req_string(args, "serverId");
        if (server_id.empty()) throw std::invalid_argument("Missing required argument: serverId");
        mgr_.remove(server_id);
        return "{\"success\":true,\"message\":" + json_quote("Server " + server_id + " deleted") + "}";
    }

    if (name == "list-servers") {
        std::ostringstream oss;
        oss << "{\"servers\":[";
        bool first = true;
        for (const auto& id : mgr_.list()) {
            if (!first) oss << ",";
            oss << json_quote(id);
            first = false;
        }
        oss << "]}";
        return oss.str();
    }

    throw std::invalid_argument("Unknown tool: " + name);
}

} // namespace mcpforge
