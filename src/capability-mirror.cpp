#include "capability-mirror.hpp"

#include "log.hpp"
#include "mcp-client.hpp"
#include "proxy-error.hpp"

namespace reloader {

const char * CapabilityMirror::restart_tool_name() {
    return "restart_server";
}

json CapabilityMirror::restart_tool() {
    return {
        {"name", restart_tool_name()},
        {"description", "Restart the underlying MCP server process. Use this after changing the server's code "
                        "so the new version is loaded. The client session stays connected and the tool, "
                        "prompt and resource lists are refreshed."},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"force", {
                    {"type", "boolean"},
                    {"description", "Kill the running server immediately instead of asking it to shut down"},
                    {"default", false}
                }}
            }},
            {"additionalProperties", false}
        }}
    };
}

std::shared_ptr<const CapabilitySnapshot> CapabilityMirror::fetch(Client & client, int timeout_ms) const {
    auto snapshot = std::make_shared<CapabilitySnapshot>();
    snapshot->server_capabilities = client.server_capabilities();
    snapshot->server_info         = client.server_info();
    snapshot->instructions        = client.initialize_result().value("instructions", json());

    json result;
    try {
        result = client.list_tools(timeout_ms);
    } catch (const rpc_error & e) {
        if (!e.is_method_not_found()) {
            throw proxy_error(proxy_errc::capability_query_fatal, std::string("tools/list failed: ") + e.what());
        }
        RELOADER_LOG_WARN("%s: child does not support tools/list, continuing with an empty tool list\n", __func__);
        snapshot->tools_supported = false;
        return snapshot;
    } catch (const proxy_error & e) {
        if (e.code() == proxy_errc::request_timeout) {
            throw proxy_error(proxy_errc::restart_timeout, std::string("tools/list timed out: ") + e.what());
        }
        throw proxy_error(proxy_errc::capability_query_fatal, std::string("tools/list failed: ") + e.what());
    }

    for (const auto & tool : result["tools"]) {
        if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
            RELOADER_LOG_WARN("%s: skipping tool without a name: %s\n", __func__, tool.dump().c_str());
            continue;
        }
        if (tool["name"] == restart_tool_name()) {
            RELOADER_LOG_WARN("%s: child tool '%s' is shadowed by the proxy's own tool\n", __func__, restart_tool_name());
            continue;
        }
        snapshot->tools.push_back(tool);
    }

    RELOADER_LOG_DEBUG("%s: mirrored %zu tools\n", __func__, snapshot->tools.size());

    return snapshot;
}

void CapabilityMirror::publish(std::shared_ptr<const CapabilitySnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
}

void CapabilityMirror::clear() {
    publish(std::make_shared<CapabilitySnapshot>());
}

std::shared_ptr<const CapabilitySnapshot> CapabilityMirror::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

json CapabilityMirror::list_tools_result() const {
    auto current = snapshot();

    json tools = current->tools;
    tools.push_back(restart_tool());

    return {{"tools", tools}};
}

} // namespace reloader
