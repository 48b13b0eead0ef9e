#pragma once

#include "mcp-transport.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace reloader {

class Client;

// What the child advertised during one connect cycle. Never modified once published.
struct CapabilitySnapshot {
    json tools               = json::array();
    json server_capabilities = json::object();
    json server_info         = json::object();
    json instructions;

    // false when the child answered tools/list with method-not-found
    bool tools_supported = true;
};

// Caches the child's tool list and merges the proxy-owned restart tool into it.
class CapabilityMirror {
public:
    static const char * restart_tool_name();
    static json         restart_tool();

    // queries a freshly connected child without touching the cache,
    // throws proxy_error(capability_query_fatal) or proxy_error(restart_timeout)
    std::shared_ptr<const CapabilitySnapshot> fetch(Client & client, int timeout_ms) const;

    void publish(std::shared_ptr<const CapabilitySnapshot> snapshot);
    void clear();

    // never null, an empty snapshot before the first connect
    std::shared_ptr<const CapabilitySnapshot> snapshot() const;

    // tools/list result: the child's tools followed by the restart tool
    json list_tools_result() const;

private:
    mutable std::mutex                        mutex_;
    std::shared_ptr<const CapabilitySnapshot> snapshot_ = std::make_shared<CapabilitySnapshot>();
};

} // namespace reloader
