#undef NDEBUG

#include "child-process.hpp"
#include "mcp-client.hpp"
#include "proxy-error.hpp"
#include "test-util.hpp"

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace reloader;

namespace {

std::unique_ptr<Client> start_fake(const std::vector<std::string> & args = {}) {
    child_spec spec;
    spec.command = FAKE_MCP_SERVER;
    spec.args    = args;

    auto client = std::make_unique<Client>(
            std::make_unique<ChildProcessTransport>(ChildProcess::spawn(spec), 500));
    client->start();
    return client;
}

std::string result_text(const json & result) {
    return result.at("content").at(0).at("text").get<std::string>();
}

void test_initialize() {
    auto client = start_fake({ "--instructions", "be nice" });

    json result = client->initialize("mcp-test-client", "1.0.0", 5000);
    assert_json_equals(result, "protocolVersion", "2025-06-18");
    assert_json_equals(result, "instructions", "be nice");

    assert_json_equals(client->server_info(), "name", "fake-mcp-server");
    assert(client->server_capabilities().at("tools").is_object());

    client->send_initialized();

    json echoed = client->call_tool("echo", {{"x", 1}}, 5000);
    assert(json::parse(result_text(echoed)) == json({{"x", 1}}));

    client->close();
    assert(!client->is_open());
}

void test_list_tools_pagination() {
    auto client = start_fake({ "--tools", "a,b,c,d,e", "--page-size", "2" });
    client->initialize("mcp-test-client", "1.0.0", 5000);

    json tools = client->list_tools(5000);
    assert((tool_names(tools) == std::vector<std::string>{ "a", "b", "c", "d", "e" }));
}

void test_concurrent_requests() {
    auto client = start_fake();
    client->initialize("mcp-test-client", "1.0.0", 5000);

    // the longest call is issued first, responses arrive in reverse order
    const int n = 6;
    std::vector<Client::pending_call> calls;
    for (int i = 0; i < n; ++i) {
        calls.push_back(client->call_async("tools/call", {
            {"name", "sleep"},
            {"arguments", {{"ms", (n - i) * 50}}}
        }));
    }

    for (int i = 0; i < n; ++i) {
        json result = client->await(calls[i], 5000);
        assert(result_text(result) == "slept " + std::to_string((n - i) * 50));
    }
}

void test_error_response() {
    auto client = start_fake();
    client->initialize("mcp-test-client", "1.0.0", 5000);

    bool thrown = false;
    try {
        client->request("does/not/exist", json::object(), 5000);
    } catch (const rpc_error & e) {
        thrown = true;
        assert(e.is_method_not_found());
        assert_json_equals(e.error(), "message", "Method not found: does/not/exist");
    }
    assert(thrown);
}

void test_timeout() {
    auto client = start_fake();
    client->initialize("mcp-test-client", "1.0.0", 5000);

    bool thrown = false;
    try {
        client->call_tool("sleep", {{"ms", 3000}}, 100);
    } catch (const proxy_error & e) {
        thrown = true;
        assert(e.code() == proxy_errc::request_timeout);
        assert(e.rpc_code() == RPC_REQUEST_TIMEOUT);
    }
    assert(thrown);

    // the connection is still usable, the cancelled sleep answers early
    assert(client->request("ping", nullptr, 5000).is_object());
}

void test_crash() {
    child_spec spec;
    spec.command = FAKE_MCP_SERVER;

    auto transport = std::make_unique<ChildProcessTransport>(ChildProcess::spawn(spec), 500);
    ChildProcessTransport * child = transport.get();

    Client client(std::move(transport));

    std::atomic<int> closed{0};
    std::vector<std::string> diagnostics;
    std::mutex diagnostics_mutex;

    client.set_close_handler([&]() { closed++; });
    client.set_diagnostics_handler([&](const std::string & line) {
        std::lock_guard<std::mutex> lock(diagnostics_mutex);
        diagnostics.push_back(line);
    });
    client.start();
    client.initialize("mcp-test-client", "1.0.0", 5000);

    auto pending = client.call_async("tools/call", {{"name", "sleep"}, {"arguments", {{"ms", 5000}}}});

    bool thrown = false;
    try {
        client.call_tool("crash", json::object(), 5000);
    } catch (const proxy_error & e) {
        thrown = true;
        assert(e.code() == proxy_errc::child_unavailable);
    }
    assert(thrown);

    // requests in flight on a dead connection fail, they are never answered late
    thrown = false;
    try {
        client.await(pending, 5000);
    } catch (const proxy_error & e) {
        thrown = true;
        assert(e.code() == proxy_errc::child_unavailable);
    }
    assert(thrown);

    assert(wait_until([&] { return closed == 1; }));
    assert(!client.is_open());

    assert(child->process().wait_exit(2000));
    assert(child->process().describe_exit() == "exited with code 3");

    assert(wait_until([&] {
        std::lock_guard<std::mutex> lock(diagnostics_mutex);
        for (const auto & line : diagnostics) {
            if (line == "crashing on request") {
                return true;
            }
        }
        return false;
    }));

    // closing after the peer went away does not report a second close
    client.close();
    assert(closed == 1);
}

// processes only come from spawn(), which owns them from the start
static_assert(!std::is_default_constructible<ChildProcess>::value, "use ChildProcess::spawn");
static_assert(!std::is_copy_constructible<ChildProcess>::value,    "ChildProcess owns its pid and pipes");

void test_spawn_failure() {
    child_spec spec;
    spec.command = "/nonexistent/mcp-server";

    bool thrown = false;
    try {
        ChildProcess::spawn(spec);
    } catch (const proxy_error & e) {
        thrown = true;
        assert(e.code() == proxy_errc::child_spawn_failure);
        assert(std::string(e.what()).find("/nonexistent/mcp-server") != std::string::npos);
    }
    assert(thrown);

    spec.command     = FAKE_MCP_SERVER;
    spec.working_dir = "/nonexistent-dir";

    thrown = false;
    try {
        ChildProcess::spawn(spec);
    } catch (const proxy_error & e) {
        thrown = true;
        assert(e.code() == proxy_errc::child_spawn_failure);
    }
    assert(thrown);
}

void test_close_while_sending() {
    child_spec spec;
    spec.command = FAKE_MCP_SERVER;

    auto transport = std::make_unique<ChildProcessTransport>(ChildProcess::spawn(spec), 500);
    ChildProcessTransport * child = transport.get();

    // the client drains the child's stdout and stderr while the senders run
    Client client(std::move(transport));
    client.start();

    std::atomic<bool> stop{false};
    std::atomic<int>  rejected{0};
    std::vector<std::thread> senders;
    for (int i = 0; i < 4; ++i) {
        senders.emplace_back([&]() {
            while (!stop) {
                try {
                    client.notify("notifications/noise", json::object());
                } catch (const std::runtime_error &) {
                    rejected++;
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    client.close();
    assert(child->is_closed());

    // the child's stdin descriptor number is free again and likely reused here
    int fds[2];
    int rc = pipe2(fds, O_CLOEXEC | O_NONBLOCK);
    assert(rc == 0);
    (void) rc;

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop = true;
    for (auto & t : senders) {
        t.join();
    }
    assert(rejected > 0);

    // no sender wrote after the close
    char byte;
    assert(::read(fds[0], &byte, 1) == -1 && errno == EAGAIN);

    ::close(fds[0]);
    ::close(fds[1]);
}

void test_terminate() {
    child_spec spec;
    spec.command = FAKE_MCP_SERVER;

    auto process = ChildProcess::spawn(spec);
    assert(!process->exited());
    assert(process->describe_exit() == "is still running");

    process->terminate(0);
    assert(process->exited());
    assert(process->describe_exit().find("killed by signal 9") != std::string::npos);
}

} // namespace

int main() {
    test_init();

    test_initialize();
    test_list_tools_pagination();
    test_concurrent_requests();
    test_error_response();
    test_timeout();
    test_crash();
    test_spawn_failure();
    test_close_while_sending();
    test_terminate();

    printf("%s: all tests passed\n", __FILE__);
    return 0;
}
