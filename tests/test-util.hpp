#pragma once

#include "log.hpp"
#include "proxy-params.hpp"
#include "stdio-transport.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <csignal>
#include <cstdlib>

#include <fcntl.h>
#include <unistd.h>

using reloader::json;

inline void pretty_print_json(const json & j) {
    printf("%s\n", j.dump(2).c_str());
}

template<typename T>
void assert_json_equals(const json & j, const std::string & key, const T & expected) {
    assert(j.contains(key));
    assert(j.at(key) == expected);
}

// a child that died leaves a broken pipe behind, RELOADER_TEST_DEBUG=1 shows all logs
inline void test_init() {
    signal(SIGPIPE, SIG_IGN);
    const char * debug = std::getenv("RELOADER_TEST_DEBUG");
    reloader_log_set_level(debug && *debug == '1' ? RELOADER_LOG_LEVEL_DEBUG : RELOADER_LOG_LEVEL_WARN);
}

inline bool wait_until(const std::function<bool()> & pred, int timeout_ms = 10000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

inline std::string temp_path(const std::string & name) {
    std::string path = "/tmp/mcp-reloader-test-" + std::to_string(getpid()) + "-" + name;
    unlink(path.c_str());
    return path;
}

inline void touch(const std::string & path) {
    std::ofstream out(path);
    out << "x\n";
}

inline size_t count_lines(const std::string & path) {
    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        n++;
    }
    return n;
}

// params that run the fake server with short delays
inline reloader::proxy_params fake_params(const std::vector<std::string> & args = {}) {
    reloader::proxy_params params;
    params.child_command      = FAKE_MCP_SERVER;
    params.child_args         = args;
    params.restart_delay_ms   = 50;
    params.restart_timeout_ms = 5000;
    params.request_timeout_ms = 5000;
    params.shutdown_grace_ms  = 500;
    return params;
}

inline std::vector<std::string> tool_names(const json & list_result) {
    std::vector<std::string> names;
    for (const auto & tool : list_result.at("tools")) {
        names.push_back(tool.at("name").get<std::string>());
    }
    return names;
}

// Plays the upstream MCP client of a Proxy over a pair of pipes. Everything the
// proxy writes is collected so tests can wait for responses and notifications.
class TestClient {
public:
    TestClient() {
        int rc = pipe2(to_proxy_, O_CLOEXEC);
        assert(rc == 0);
        rc = pipe2(from_proxy_, O_CLOEXEC);
        assert(rc == 0);
        (void) rc;
        peer_   = std::make_unique<reloader::FdTransport>(from_proxy_[0], to_proxy_[1]);
        reader_ = std::thread(&TestClient::read_loop, this);
    }

    ~TestClient() {
        peer_->close();
        reader_.join();
        for (int fd : { to_proxy_[0], to_proxy_[1], from_proxy_[0], from_proxy_[1] }) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    // the proxy's side of the connection, must not outlive this object
    std::unique_ptr<reloader::Transport> proxy_transport() {
        return std::make_unique<reloader::FdTransport>(to_proxy_[0], from_proxy_[1]);
    }

    void send(const json & message) {
        peer_->send(message);
    }

    int64_t send_request(const std::string & method, const json & params = json::object()) {
        int64_t id = next_id_++;
        send({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params}
        });
        return id;
    }

    void send_notification(const std::string & method, const json & params = json::object()) {
        send({
            {"jsonrpc", "2.0"},
            {"method", method},
            {"params", params}
        });
    }

    // the whole response message, null on timeout
    json wait_response(const json & id, int timeout_ms = 10000) {
        json found;
        wait_for([&](const json & m) {
            if (!m.contains("method") && m.contains("id") && m["id"] == id) {
                found = m;
                return true;
            }
            return false;
        }, timeout_ms);
        return found;
    }

    // responses received so far for one id
    size_t count_responses(const json & id) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto & m : messages_) {
            if (!m.contains("method") && m.contains("id") && m["id"] == id) {
                n++;
            }
        }
        return n;
    }

    json request(const std::string & method, const json & params = json::object(), int timeout_ms = 10000) {
        return wait_response(send_request(method, params), timeout_ms);
    }

    // first request the proxy sent us with this method, null on timeout
    json wait_request(const std::string & method, int timeout_ms = 10000) {
        json found;
        wait_for([&](const json & m) {
            if (m.value("method", "") == method && m.contains("id")) {
                found = m;
                return true;
            }
            return false;
        }, timeout_ms);
        return found;
    }

    size_t count(const std::string & method) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto & m : messages_) {
            if (m.value("method", "") == method) {
                n++;
            }
        }
        return n;
    }

    std::vector<std::string> notification_methods() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> methods;
        for (const auto & m : messages_) {
            if (m.contains("method") && !m.contains("id")) {
                methods.push_back(m["method"].get<std::string>());
            }
        }
        return methods;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    // end of input for the proxy
    void disconnect() {
        ::close(to_proxy_[1]);
        to_proxy_[1] = -1;
    }

private:
    bool wait_for(const std::function<bool(const json &)> & pred, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
            for (const auto & m : messages_) {
                if (pred(m)) {
                    return true;
                }
            }
            return false;
        });
    }

    void read_loop() {
        json message;
        while (peer_->receive(message)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(message);
            }
            cv_.notify_all();
        }
    }

    int to_proxy_[2]   = { -1, -1 };
    int from_proxy_[2] = { -1, -1 };

    std::unique_ptr<reloader::FdTransport> peer_;
    std::thread                            reader_;

    std::mutex              mutex_;
    std::condition_variable cv_;
    std::vector<json>       messages_;
    std::atomic<int64_t>    next_id_{1};
};
