#pragma once

#include "capability-mirror.hpp"
#include "child-process.hpp"
#include "mcp-client.hpp"
#include "proxy-params.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace reloader {

enum class ChildStatus {
    Disconnected,
    Connecting,
    Connected,
};

const char * child_status_name(ChildStatus status);

// One spawned child and the client connected to it. A new endpoint is created for
// every (re)start, an endpoint never goes back to Connected once it left that state.
class ChildEndpoint {
public:
    ChildEndpoint(uint64_t generation, std::unique_ptr<Client> client, ChildProcessTransport * transport);
    ~ChildEndpoint();

    uint64_t    generation() const { return generation_; }
    Client &    client()           { return *client_; }
    ChildStatus status()     const { return status_; }
    void        set_status(ChildStatus status) { status_ = status; }
    pid_t       pid()        const;

    // closes the client, then the process, logging instead of throwing, idempotent
    void stop(bool force);

    // reaps the process if it is gone and describes how it ended
    std::string exit_description();

private:
    uint64_t                 generation_;
    std::unique_ptr<Client>  client_;
    ChildProcessTransport *  transport_;  // owned by client_
    std::atomic<ChildStatus> status_{ChildStatus::Connecting};
};

// Owns the lifecycle of the child server: spawn, handshake, capability refresh,
// crash detection and teardown. Publishing a new endpoint and its capability
// snapshot happens under one lock.
class ChildSupervisor {
public:
    using exit_handler         = std::function<void(uint64_t generation, const std::string & reason)>;
    using notification_handler = std::function<void(uint64_t generation, const json & notification)>;
    using request_handler      = std::function<void(uint64_t generation, const json & request)>;

    ChildSupervisor(const proxy_params & params, CapabilityMirror & mirror);
    ~ChildSupervisor();

    ChildSupervisor(const ChildSupervisor &) = delete;
    ChildSupervisor & operator=(const ChildSupervisor &) = delete;

    // install before the first start()
    void set_exit_handler        (exit_handler         handler) { on_exit_         = std::move(handler); }
    void set_notification_handler(notification_handler handler) { on_notification_ = std::move(handler); }
    void set_request_handler     (request_handler      handler) { on_request_      = std::move(handler); }

    // stops the current child, then spawns, initializes and mirrors a new one;
    // throws proxy_error (child_spawn_failure, restart_timeout, capability_query_fatal,
    // child_unavailable after shutdown)
    void start(std::chrono::steady_clock::time_point deadline, bool force = false);

    // no-op when nothing is running
    void stop(bool force = false);

    // stop() and refuse any further start()
    void shutdown();

    // the connected endpoint, or null
    std::shared_ptr<ChildEndpoint> current() const;

    // the endpoint of a given generation while it is still the published one
    std::shared_ptr<ChildEndpoint> endpoint(uint64_t generation) const;

    ChildStatus status() const;
    uint64_t    generation() const;

    // re-reads the tool list of a generation, e.g. after the child announced a change;
    // keeps the cached snapshot when the query fails
    bool refresh_capabilities(uint64_t generation);

private:
    void on_client_closed(uint64_t generation);

    const proxy_params & params_;
    CapabilityMirror &   mirror_;

    exit_handler         on_exit_;
    notification_handler on_notification_;
    request_handler      on_request_;

    mutable std::mutex             mutex_;
    std::shared_ptr<ChildEndpoint> endpoint_;
    std::shared_ptr<ChildEndpoint> connecting_;
    uint64_t                       generation_counter_ = 0;
    bool                           shut_down_          = false;
};

} // namespace reloader
