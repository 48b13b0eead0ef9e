#pragma once

#include "capability-mirror.hpp"
#include "child-supervisor.hpp"
#include "mcp-transport.hpp"
#include "proxy-params.hpp"
#include "restart-controller.hpp"
#include "worker-pool.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace reloader {

// Upstream face of the proxy. Answers initialize, ping, tools/list and the restart
// tool itself, forwards everything else to the connected child, and relays
// notifications and server-initiated requests in both directions.
class ProtocolBridge {
public:
    ProtocolBridge(const proxy_params & params,
                   Transport          & upstream,
                   CapabilityMirror   & mirror,
                   ChildSupervisor    & supervisor,
                   RestartController  & restarts,
                   WorkerPool         & workers,
                   WorkerPool         & control_lane,
                   WorkerPool         & notify_lane);

    ProtocolBridge(const ProtocolBridge &) = delete;
    ProtocolBridge & operator=(const ProtocolBridge &) = delete;

    // Process a message read from upstream. initialize, ping and tools/list are answered
    // in place, restart_server calls run on the control lane and every other request on
    // the worker pool, so requests stuck on the child never delay the proxy's own methods.
    // Notifications and responses are handled in place.
    // Returns false for messages that are not JSON-RPC 2.0.
    bool handle_message(const json & message);

    // wired to the supervisor, called on the child's reader thread
    void handle_child_notification(uint64_t generation, const json & notification);
    void handle_child_request     (uint64_t generation, const json & request);

    // sends a parameterless notification upstream
    void notify_upstream(const std::string & method);

    // forwarded requests currently waiting for the child
    size_t inflight() const;

    // child requests relayed upstream and not answered yet
    size_t relayed() const;

    static const char * protocol_versions[];

private:
    // MCP protocol methods
    void handle_request(const json & request);
    json dispatch(const json & id, const std::string & method, const json & params);
    json handle_initialize(const json & params);
    json handle_tool_call(const json & id, const json & params);
    json handle_restart_tool(const json & arguments);

    json forward(const json & id, const std::string & method, const json & params);

    void handle_upstream_notification(const json & notification);
    void handle_upstream_response(const json & response);
    void relay_child_notification(uint64_t generation, json notification);

    // drops relayed requests of other generations and those older than the request timeout,
    // expects mutex_ to be held
    void prune_relayed(uint64_t live_generation);

    // Response helpers
    void send_message(const json & message);
    void send_result(const json & id, const json & result);
    void send_error (const json & id, const json & error);

    struct inflight_request {
        std::weak_ptr<ChildEndpoint> endpoint;
        int64_t                      child_id = 0;
    };

    struct relayed_request {
        uint64_t                              generation = 0;
        json                                  child_id;
        std::chrono::steady_clock::time_point relayed_at;
    };

    const proxy_params & params_;
    Transport &          upstream_;
    CapabilityMirror &   mirror_;
    ChildSupervisor &    supervisor_;
    RestartController &  restarts_;
    WorkerPool &         workers_;
    WorkerPool &         control_lane_;
    WorkerPool &         notify_lane_;

    mutable std::mutex                      mutex_;
    std::map<std::string, inflight_request> inflight_;  // by upstream request id
    std::map<std::string, relayed_request>  relayed_;   // by proxy-assigned id
    int64_t                                 relay_counter_ = 0;
};

} // namespace reloader
