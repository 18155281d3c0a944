#pragma once

#include "server_manager.h"

#include <json-c/json.h>

#include <string>

namespace mcpforge {

// Upstream operations exposed by the stdio server:
//   create-server-from-template, execute-tool, get-server-tools,
//   update-server, delete-server, list-servers
//
// Every call yields a {"content":[{"type":"text","text":...}]} result. Failures
// of any kind become {"error": message} in the text block and never escape.
class Dispatcher {
public:
    explicit Dispatcher(ServerManager& mgr) : mgr_(mgr) {}

    // {"tools":[...]} as returned by tools/list.
    std::string list_tools_result() const;

    // params: the tools/call params object ({"name":..., "arguments":{...}}).
    std::string call(json_object* params);

private:
    std::string dispatch(const std::string& name, json_object* args);

    ServerManager& mgr_;
};

} // namespace mcpforge
