#pragma once

// Minimal HTTP/1.1 helpers for the façade: one request per connection,
// Content-Length bodies only, Connection: close.

#include <atomic>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace mcpforge {

// Socket recv/send timeouts so a stalled client cannot pin a connection thread.
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// max_body: Content-Length above this is rejected without reading the body.
inline bool read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    {
        int cl_count = 0;
        std::istringstream iss(head);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string low = line;
            for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            if (low.rfind("content-length:", 0) == 0) {
                cl_count++;
                if (cl_count > 1) return false; // duplicate Content-Length
                std::string v = line.substr(15);
                while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
                try {
                    cl = (size_t)std::stoull(v);
                } catch (const std::exception&) {
                    return false;
                }
            }
        }
    }

    if (cl > max_body) return false;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return true;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Error";
}

inline void send_body(int fd, int code, const std::string& content_type, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
    auto s = oss.str();
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline void send_json(int fd, int code, const std::string& json) {
    send_body(fd, code, "application/json; charset=utf-8", json);
}

inline void send_text(int fd, int code, const std::string& text) {
    send_body(fd, code, "text/html; charset=utf-8", text);
}

// One thread per accepted connection. Owned by the accept loop, not shared.
// reap_finished() joins the threads whose handler has returned, so the set
// only ever holds live connections plus the ones finished since the last call.
class ConnectionThreads {
public:
    ConnectionThreads() = default;
    ConnectionThreads(const ConnectionThreads&) = delete;
    ConnectionThreads& operator=(const ConnectionThreads&) = delete;
    ~ConnectionThreads() { join_all(); }

    template <typename Fn>
    void spawn(Fn fn) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([fn = std::move(fn), done]() mutable {
            struct Done {
                std::atomic<bool>& flag;
                ~Done() { flag.store(true); }
            } guard{*done};
            fn();
        });
        threads_.push_back(Entry{std::move(t), std::move(done)});
    }

    // Returns how many threads were joined.
    size_t reap_finished() {
        size_t joined = 0;
        for (auto it = threads_.begin(); it != threads_.end();) {
            if (it->done->load()) {
                if (it->thread.joinable()) it->thread.join();
                it = threads_.erase(it);
                joined++;
            } else {
                ++it;
            }
        }
        return joined;
    }

    void join_all() {
        for (auto& e : threads_) {
            if (e.thread.joinable()) e.thread.join();
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Entry> threads_;
};

} // namespace mcpforge
