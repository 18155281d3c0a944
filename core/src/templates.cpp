#include "mcpforge/templates.h"

namespace mcpforge {

namespace {

const std::string kNodeEcho = R"JS(import { Server } from "@modelcontextprotocol/sdk/server/index.js";
import { StdioServerTransport } from "@modelcontextprotocol/sdk/server/stdio.js";
import {
  CallToolRequestSchema,
  ListToolsRequestSchema
} from "@modelcontextprotocol/sdk/types.js";

const server = new Server({
  name: "dynamic-test-server",
  version: "1.0.0"
}, {
  capabilities: {
    tools: {}
  }
});

server.setRequestHandler(ListToolsRequestSchema, async () => {
  return {
    tools: [{
      name: "echo",
      description: "Echo back a message",
      inputSchema: {
        type: "object",
        properties: {
          message: { type: "string" }
        },
        required: ["message"]
      }
    }]
  };
});

server.setRequestHandler(CallToolRequestSchema, async (request) => {
  if (request.params.name === "echo") {
    const args = request.params.arguments || {};
    return {
      content: [
        {
          type: "text",
          text: `Echo: ${args.message}`
        }
      ]
    };
  }
  throw new Error("Tool not found");
});

const transport = new StdioServerTransport();
await server.connect(transport);
)JS";

const std::string kPythonEcho = R"PY(import asyncio

import mcp.types as types
from mcp.server import Server
from mcp.server.stdio import stdio_server

app = Server("dynamic-test-server")


@app.list_tools()
async def list_tools():
    return [
        types.Tool(
            name="echo",
            description="Echo back a message",
            inputSchema={
                "type": "object",
                "properties": {
                    "message": {"type": "string"}
                },
                "required": ["message"],
            },
        )
    ]


@app.call_tool()
async def call_tool(name, arguments):
    if name == "echo":
        return [types.TextContent(type="text", text=f"Echo: {arguments.get('message')}")]
    raise ValueError(f"Tool not found: {name}")


async def main():
    async with stdio_server() as streams:
        await app.run(streams[0], streams[1], app.create_initialization_options())


if __name__ == "__main__":
    asyncio.run(main())
)PY";

} // namespace

const std::string& echo_template(Language lang) {
    switch (lang) {
        case Language::TYPESCRIPT:
        case Language::JAVASCRIPT:
            return kNodeEcho;
        case Language::PYTHON:
            return kPythonEcho;
    }
    return kNodeEcho;
}

} // namespace mcpforge
