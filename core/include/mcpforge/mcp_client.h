#pragma once

#include "types.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpforge {

// MCP client over a pair of pipe fds (line-delimited JSON-RPC 2.0).
//
// A reader thread owns every read from the worker. Requests from any number of
// threads are correlated to replies by id; writes are serialized.
class McpClient {
public:
    struct Options {
        int handshake_timeout_ms{60000};
        int request_timeout_ms{60000};  // 0 = wait forever
        std::string client_name{"mcp-create-client"};
        std::string client_version{"1.0.0"};
        std::string log_tag{"mcp"};
    };

    static constexpr const char* kProtocolVersion = "2024-11-05";

    // Takes ownership of both fds.
    McpClient(int write_fd, int read_fd, Options opt);
    ~McpClient();
    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // initialize + notifications/initialized. Throws ForgeError(HANDSHAKE_FAILED).
    void connect();

    // Follows nextCursor until exhausted. Throws ForgeError(TOOL_INVOCATION_FAILED).
    std::vector<ToolDescriptor> list_tools();

    // Returns the raw result object. A JSON-RPC error reply throws
    // ForgeError(TOOL_INVOCATION_FAILED) with the error object as detail().
    std::string call_tool(const std::string& name, const std::string& args_json);

    // Stops accepting requests, fails pending ones, joins the reader, releases the fds.
    void close();

    bool is_open() const;
    const std::string& server_name() const { return server_name_; }

private:
    struct Reply {
        bool ok{false};
        std::string result_json;   // ok
        std::string error_json;    // JSON-RPC error object, if the worker sent one
        std::string failure;       // transport failure text
    };

    struct Pending {
        bool done{false};
        Reply reply;
    };

    Reply request(const std::string& method, const std::string& params_json, int timeout_ms);
    bool notify(const std::string& method, const std::string& params_json);
    bool write_line(const std::string& line);

    void reader_loop();
    void handle_line(const std::string& line);
    void fail_all_pending(const std::string& why);

    Options opt_;
    int write_fd_{-1};
    int read_fd_{-1};

    std::mutex write_mu_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<int64_t, std::shared_ptr<Pending>> pending_;
    int64_t next_id_{1};
    bool closed_{false};           // no new requests accepted
    std::string close_reason_{"connection closed"};

    std::atomic<bool> stop_reader_{false};
    std::thread reader_;

    std::string server_name_;
};

} // namespace mcpforge
