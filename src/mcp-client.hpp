#pragma once

#include "mcp-transport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace reloader {

// JSON-RPC client side of an MCP connection. A reader thread correlates responses with
// pending requests by id, so any number of requests may be in flight at once.
class Client {
public:
    using notification_handler = std::function<void(const json & notification)>;
    using request_handler      = std::function<void(const json & request)>;
    using close_handler        = std::function<void()>;
    using diagnostics_handler  = std::function<void(const std::string & line)>;

    struct pending_call {
        int64_t           id = 0;
        std::future<json> response;
    };

    explicit Client(std::unique_ptr<Transport> transport);
    ~Client();

    Client(const Client &) = delete;
    Client & operator=(const Client &) = delete;

    // handlers must be installed before start(), they run on the reader threads
    void set_notification_handler(notification_handler handler) { on_notification_ = std::move(handler); }
    void set_request_handler     (request_handler      handler) { on_request_      = std::move(handler); }
    void set_close_handler       (close_handler        handler) { on_close_        = std::move(handler); }
    void set_diagnostics_handler (diagnostics_handler  handler) { on_diagnostics_  = std::move(handler); }

    void start();

    // closes the transport and fails everything pending, idempotent
    void close();

    bool is_open() const { return open_; }

    // Core MCP communication
    pending_call call_async(const std::string & method, const json & params);

    // the "result" member of the response; throws rpc_error for an error response,
    // proxy_error(request_timeout) or proxy_error(child_unavailable)
    json await(pending_call & call, int timeout_ms);

    json request(const std::string & method, const json & params, int timeout_ms);
    void notify (const std::string & method, const json & params);
    void cancel (int64_t id, const std::string & reason);

    // replies to a request the peer sent us
    void send_result(const json & id, const json & result);
    void send_error (const json & id, const json & error);

    // MCP protocol methods
    json initialize(const std::string & client_name, const std::string & client_version, int timeout_ms);
    void send_initialized();
    json list_tools(int timeout_ms);
    json call_tool(const std::string & tool_name, const json & arguments, int timeout_ms);

    // filled by initialize()
    const json & server_info()         const { return server_info_; }
    const json & server_capabilities() const { return server_capabilities_; }
    const json & initialize_result()   const { return initialize_result_; }

    Transport & transport() { return *transport_; }

private:
    void read_loop();
    void diagnostics_loop();
    void dispatch(const json & message);
    void fail_pending(const std::string & reason);

    std::unique_ptr<Transport> transport_;

    std::thread reader_;
    std::thread diagnostics_;

    std::mutex                           mutex_;
    std::map<int64_t, std::promise<json>> pending_;
    int64_t                              request_id_counter_ = 0;

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    notification_handler on_notification_;
    request_handler      on_request_;
    close_handler        on_close_;
    diagnostics_handler  on_diagnostics_;

    json server_info_         = json::object();
    json server_capabilities_ = json::object();
    json initialize_result_   = json::object();
};

} // namespace reloader
