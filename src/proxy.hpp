#pragma once

#include "capability-mirror.hpp"
#include "child-supervisor.hpp"
#include "mcp-transport.hpp"
#include "protocol-bridge.hpp"
#include "proxy-params.hpp"
#include "restart-controller.hpp"
#include "worker-pool.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace reloader {

// The whole proxy: one upstream connection, one supervised child.
class Proxy {
public:
    // upstream defaults to stdin/stdout
    explicit Proxy(const proxy_params & params, std::unique_ptr<Transport> upstream = nullptr);
    ~Proxy();

    Proxy(const Proxy &) = delete;
    Proxy & operator=(const Proxy &) = delete;

    // starts the child and serves upstream until it disconnects or shutdown() is called;
    // returns 1 if the child could not be started
    int run();

    // stops restarts, the child and the workers, then closes upstream; idempotent, any thread
    void shutdown();

    ChildSupervisor   & supervisor() { return supervisor_; }
    RestartController & restarts()   { return restarts_; }
    CapabilityMirror  & mirror()     { return mirror_; }
    ProtocolBridge    & bridge()     { return bridge_; }

private:
    proxy_params               params_;
    std::unique_ptr<Transport> upstream_;

    CapabilityMirror  mirror_;
    ChildSupervisor   supervisor_;
    RestartController restarts_;
    WorkerPool        workers_;
    WorkerPool        control_lane_;
    WorkerPool        notify_lane_;
    ProtocolBridge    bridge_;

    std::once_flag    shutdown_once_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace reloader
