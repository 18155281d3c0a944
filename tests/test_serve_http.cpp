#include "test_common.h"

#include "serve_http.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

using namespace mcpforge;

static bool wait_for(const std::function<bool()>& pred, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

int main() {
    // 1) finished connection threads are joined while others keep running
    {
        ConnectionThreads conns;
        std::mutex mu;
        std::condition_variable cv;
        bool release = false;
        std::atomic<int> finished{0};

        conns.spawn([&] {
            std::unique_lock<std::mutex> lk(mu);
            cv.wait(lk, [&] { return release; });
        });
        for (int i = 0; i < 100; i++) {
            conns.spawn([&] { finished++; });
        }
        expect_true(wait_for([&] { return finished.load() == 100; }, 5000), "short handlers ran");

        size_t joined = 0;
        expect_true(wait_for([&] { joined += conns.reap_finished(); return conns.size() == 1; }, 5000),
                    "finished threads reaped while one connection is still open");
        expect_eq_ll((long long)joined, 100, "every finished thread joined once");

        conns.spawn([&] { finished++; });
        expect_true(wait_for([&] { conns.reap_finished(); return conns.size() == 1; }, 5000),
                    "steady traffic does not accumulate threads");

        {
            std::lock_guard<std::mutex> lk(mu);
            release = true;
        }
        cv.notify_all();
        expect_true(wait_for([&] { conns.reap_finished(); return conns.size() == 0; }, 5000),
                    "long handler reaped after it returns");
    }

    // 2) join_all waits for running handlers
    {
        std::atomic<bool> ran{false};
        ConnectionThreads conns;
        conns.spawn([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            ran = true;
        });
        conns.join_all();
        expect_true(ran.load(), "join_all waited for the handler");
        expect_eq_ll((long long)conns.size(), 0, "nothing left after join_all");
    }

    // 3) request framing over a socket pair
    {
        int sv[2];
        expect_true(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0, "socketpair");
        std::string req = "POST /api/mcp HTTP/1.1\r\nHost: x\r\nContent-Length: 7\r\n\r\n{\"a\":1}";
        expect_eq_ll((long long)::write(sv[0], req.data(), req.size()), (long long)req.size(), "request written");
        std::string head, body;
        expect_true(read_http_request(sv[1], head, body, 1024), "request parsed");
        expect_true(contains(head, "POST /api/mcp"), "request line kept: " + head);
        expect_eq_str(body, "{\"a\":1}", "body read to Content-Length");
        ::close(sv[0]);
        ::close(sv[1]);
    }

    std::cerr << "test_serve_http: ALL PASSED" << std::endl;
    return 0;
}
