#pragma once

// mcpforge stdio: MCP server on stdin/stdout.
int cmd_stdio(int argc, char** argv);
