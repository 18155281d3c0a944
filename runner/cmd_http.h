#pragma once

// mcpforge http: stateless HTTP façade, one stdio server process per request.
int cmd_http(int argc, char** argv);
