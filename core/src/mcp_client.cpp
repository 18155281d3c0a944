#include "mcpforge/mcp_client.h"
#include "mcpforge/errors.h"
#include "mcpforge/json_mini.h"
#include "mcpforge/log.h"
#include "mcpforge/proc.h"
#include "mcpforge/serialization.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <set>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcpforge {

namespace {

constexpr size_t MAX_LINE_BYTES = 16 * 1024 * 1024;

std::string rpc_request(int64_t id, const std::string& method, const std::string& params_json) {
    std::string s = "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
                    ",\"method\":" + json_quote(method);
    if (!params_json.empty()) s += ",\"params\":" + params_json;
    s += "}";
    return s;
}

std::string error_message(const std::string& error_json) {
    json_mini::Doc d = json_mini::parse(error_json);
    if (auto m = json_mini::get_string(d.root, "message")) return *m;
    return error_json;
}

} // namespace

McpClient::McpClient(int write_fd, int read_fd, Options opt)
    : opt_(std::move(opt)), write_fd_(write_fd), read_fd_(read_fd) {
    ::signal(SIGPIPE, SIG_IGN);
    int flags = ::fcntl(read_fd_, F_GETFL, 0);
    if (flags >= 0) ::fcntl(read_fd_, F_SETFL, flags | O_NONBLOCK);
    reader_ = std::thread([this] { reader_loop(); });
}

McpClient::~McpClient() {
    close();
}

bool McpClient::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return !closed_;
}

// ---- wire ----

bool McpClient::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (write_fd_ < 0) return false;
    std::string data = line + "\n";
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(write_fd_, data.data() + off, data.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n == -1 && errno == EINTR) continue;
        return false;  // EPIPE: worker gone
    }
    return true;
}

bool McpClient::notify(const std::string& method, const std::string& params_json) {
    std::string s = "{\"jsonrpc\":\"2.0\",\"method\":" + json_quote(method);
    if (!params_json.empty()) s += ",\"params\":" + params_json;
    s += "}";
    return write_line(s);
}

McpClient::Reply McpClient::request(const std::string& method, const std::string& params_json,
                                    int timeout_ms) {
    auto p = std::make_shared<Pending>();
    int64_t id;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            Reply r;
            r.failure = close_reason_;
            return r;
        }
        id = next_id_++;
        pending_[id] = p;
    }

    if (!write_line(rpc_request(id, method, params_json))) {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.erase(id);
        Reply r;
        r.failure = "write to worker failed (worker exited?)";
        return r;
    }

    std::unique_lock<std::mutex> lk(mu_);
    if (timeout_ms > 0) {
        bool ok = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return p->done; });
        if (!ok) {
            pending_.erase(id);
            Reply r;
            r.failure = method + " timed out after " + std::to_string(timeout_ms) + " ms";
            return r;
        }
    } else {
        cv_.wait(lk, [&] { return p->done; });
    }
    return p->reply;
}

// ---- reader ----

void McpClient::reader_loop() {
    std::string buf;
    std::string why = "connection closed";
    while (!stop_reader_.load()) {
        struct pollfd pfd;
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, 100);
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) continue;

        char chunk[8192];
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, (size_t)n);
            size_t pos;
            while ((pos = buf.find('\n')) != std::string::npos) {
                std::string line = buf.substr(0, pos);
                buf.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) handle_line(line);
            }
            if (buf.size() > MAX_LINE_BYTES) {
                why = "worker sent an oversized message";
                log_warn(opt_.log_tag, why);
                break;
            }
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        break;  // EOF or read error
    }
    fail_all_pending(why);
}

void McpClient::handle_line(const std::string& line) {
    json_mini::Doc d = json_mini::parse(line);
    if (!json_mini::is_object(d.root)) {
        log_debug(opt_.log_tag, "ignoring non-JSON line from worker: " + tail_excerpt(line, 200));
        return;
    }

    json_object* id = json_mini::get(d.root, "id");
    auto method = json_mini::get_string(d.root, "method");

    if (method) {
        if (!id) {
            log_debug(opt_.log_tag, "notification " + *method);
            return;
        }
        // Server-initiated request
        std::string id_json = json_mini::dump(id);
        std::string reply = (*method == "ping")
            ? "{\"jsonrpc\":\"2.0\",\"id\":" + id_json + ",\"result\":{}}"
            : "{\"jsonrpc\":\"2.0\",\"id\":" + id_json +
              ",\"error\":{\"code\":-32601,\"message\":\"Method not found\"}}";
        if (!write_line(reply)) {
            log_debug(opt_.log_tag, "cannot answer worker request " + *method + ": worker stdin closed");
        }
        return;
    }

    if (!id || !json_object_is_type(id, json_type_int)) {
        log_debug(opt_.log_tag, "reply without usable id: " + tail_excerpt(line, 200));
        return;
    }
    int64_t rid = json_object_get_int64(id);

    Reply r;
    if (auto err = json_mini::get_raw(d.root, "error")) {
        r.ok = false;
        r.error_json = *err;
    } else {
        r.ok = true;
        r.result_json = json_mini::get_raw(d.root, "result").value_or("null");
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = pending_.find(rid);
        if (it == pending_.end()) {
            log_debug(opt_.log_tag, "late or unknown reply id " + std::to_string(rid));
            return;
        }
        it->second->reply = std::move(r);
        it->second->done = true;
        pending_.erase(it);
    }
    cv_.notify_all();
}

void McpClient::fail_all_pending(const std::string& why) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        close_reason_ = why;
        for (auto& kv : pending_) {
            kv.second->reply = Reply{};
            kv.second->reply.failure = why;
            kv.second->done = true;
        }
        pending_.clear();
    }
    cv_.notify_all();
}

// ---- protocol ----

void McpClient::connect() {
    json_mini::Doc params(json_object_new_object());
    json_object_object_add(params.root, "protocolVersion", json_object_new_string(kProtocolVersion));
    json_object_object_add(params.root, "capabilities", json_object_new_object());
    json_object* ci = json_object_new_object();
    json_object_object_add(ci, "name", json_object_new_string(opt_.client_name.c_str()));
    json_object_object_add(ci, "version", json_object_new_string(opt_.client_version.c_str()));
    json_object_object_add(params.root, "clientInfo", ci);

    Reply r = request("initialize", json_mini::dump(params.root), opt_.handshake_timeout_ms);
    if (!r.failure.empty()) throw ForgeError::handshake_failed(r.failure);
    if (!r.ok) throw ForgeError::handshake_failed("initialize rejected: " + error_message(r.error_json));

    json_mini::Doc res = json_mini::parse(r.result_json);
    if (!json_mini::is_object(res.root)) {
        throw ForgeError::handshake_failed("initialize returned a non-object result");
    }
    if (auto v = json_mini::get_string(res.root, "protocolVersion")) {
        if (*v != kProtocolVersion) {
            log_debug(opt_.log_tag, "worker negotiated protocol " + *v);
        }
    }
    if (auto name = json_mini::get_string(json_mini::get(res.root, "serverInfo"), "name")) {
        server_name_ = *name;
    }

    if (!notify("notifications/initialized", "")) {
        throw ForgeError::handshake_failed("worker closed stdin during handshake");
    }
    log_debug(opt_.log_tag, "handshake complete with '" + server_name_ + "'");
}

std::vector<ToolDescriptor> McpClient::list_tools() {
    std::vector<ToolDescriptor> out;
    std::set<std::string> seen_cursors;
    std::string cursor;

    while (true) {
        std::string params = cursor.empty() ? "{}" : "{\"cursor\":" + json_quote(cursor) + "}";
        Reply r = request("tools/list", params, opt_.request_timeout_ms);
        if (!r.failure.empty()) throw ForgeError::tool_invocation_failed(r.failure, "");
        if (!r.ok) throw ForgeError::tool_invocation_failed(error_message(r.error_json), r.error_json);

        json_mini::Doc res = json_mini::parse(r.result_json);
        json_object* tools = json_mini::get(res.root, "tools");
        if (tools && json_object_is_type(tools, json_type_array)) {
            size_t n = json_object_array_length(tools);
            for (size_t i = 0; i < n; i++) {
                ToolDescriptor d;
                if (tool_descriptor_from_json(json_object_array_get_idx(tools, i), &d)) {
                    out.push_back(std::move(d));
                } else {
                    log_warn(opt_.log_tag, "skipping tool descriptor without a name");
                }
            }
        }

        auto next = json_mini::get_string(res.root, "nextCursor");
        if (!next || next->empty() || !seen_cursors.insert(*next).second) break;
        cursor = *next;
    }
    return out;
}

std::string McpClient::call_tool(const std::string& name, const std::string& args_json) {
    json_mini::Doc args = json_mini::parse(args_json.empty() ? "{}" : args_json);
    if (!json_mini::is_object(args.root)) {
        throw ForgeError::tool_invocation_failed("tool arguments must be a JSON object", "");
    }
    json_mini::Doc params(json_object_new_object());
    json_object_object_add(params.root, "name", json_object_new_string(name.c_str()));
    json_object_object_add(params.root, "arguments", args.release());

    Reply r = request("tools/call", json_mini::dump(params.root), opt_.request_timeout_ms);
    if (!r.failure.empty()) throw ForgeError::tool_invocation_failed(r.failure, "");
    if (!r.ok) throw ForgeError::tool_invocation_failed(error_message(r.error_json), r.error_json);
    return r.result_json;
}

void McpClient::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!closed_) {
            closed_ = true;
            close_reason_ = "connection closed";
        }
    }
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        if (write_fd_ >= 0) {
            ::close(write_fd_);  // EOF on the worker's stdin
            write_fd_ = -1;
        }
    }
    stop_reader_.store(true);
    if (reader_.joinable()) reader_.join();
    fail_all_pending("connection closed");
    if (read_fd_ >= 0) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
}

} // namespace mcpforge
