#include "protocol-bridge.hpp"

#include "log.hpp"
#include "mcp-client.hpp"
#include "proxy-error.hpp"

#include <chrono>
#include <stdexcept>

namespace reloader {

namespace {

const char * server_version = "1.0.0-dev";

json text_result(const std::string & text, bool is_error) {
    json result = {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", text}
            }
        })}
    };
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

// what a child without the feature would have answered, or null
json empty_list_result(const std::string & method) {
    if (method == "prompts/list") {
        return {{"prompts", json::array()}};
    }
    if (method == "resources/list") {
        return {{"resources", json::array()}};
    }
    if (method == "resources/templates/list") {
        return {{"resourceTemplates", json::array()}};
    }
    if (method == "completion/complete") {
        return {{"completion", {
            {"values", json::array()},
            {"total", 0},
            {"hasMore", false}
        }}};
    }
    return json();
}

const json & object_or_empty(const json & value) {
    static const json empty = json::object();
    return value.is_object() ? value : empty;
}

// answered from local state without waiting on anything
bool is_local_method(const std::string & method) {
    return method == "initialize" || method == "ping" || method == "tools/list";
}

bool is_restart_call(const std::string & method, const json & request) {
    if (method != "tools/call" || !request.contains("params")) {
        return false;
    }
    const json & params = object_or_empty(request["params"]);
    return params.contains("name") && params["name"] == CapabilityMirror::restart_tool_name();
}

} // namespace

const char * ProtocolBridge::protocol_versions[] = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
    "2024-10-07",
};

ProtocolBridge::ProtocolBridge(const proxy_params & params,
                               Transport          & upstream,
                               CapabilityMirror   & mirror,
                               ChildSupervisor    & supervisor,
                               RestartController  & restarts,
                               WorkerPool         & workers,
                               WorkerPool         & control_lane,
                               WorkerPool         & notify_lane)
    : params_(params), upstream_(upstream), mirror_(mirror), supervisor_(supervisor),
      restarts_(restarts), workers_(workers), control_lane_(control_lane), notify_lane_(notify_lane) {}

bool ProtocolBridge::handle_message(const json & message) {
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        RELOADER_LOG_WARN("%s: ignoring message that is not JSON-RPC 2.0: %s\n", __func__, message.dump().c_str());
        return false;
    }

    const bool has_id = message.contains("id") && !message["id"].is_null();

    if (message.contains("method")) {
        if (!message["method"].is_string()) {
            if (has_id) {
                send_error(message["id"], {
                    {"code", RPC_INVALID_REQUEST},
                    {"message", "Invalid Request: method must be a string"}
                });
            }
            return false;
        }

        if (!has_id) {
            handle_upstream_notification(message);
            return true;
        }

        const std::string method = message["method"].get<std::string>();
        if (is_local_method(method)) {
            handle_request(message);
            return true;
        }

        WorkerPool & pool = is_restart_call(method, message) ? control_lane_ : workers_;
        if (!pool.push([this, message]() { handle_request(message); })) {
            send_error(message["id"], proxy_error(proxy_errc::child_unavailable, "proxy is shutting down").to_rpc_error());
        }
        return true;
    }

    if (has_id && (message.contains("result") || message.contains("error"))) {
        handle_upstream_response(message);
        return true;
    }

    RELOADER_LOG_WARN("%s: ignoring message without method or result: %s\n", __func__, message.dump().c_str());
    return false;
}

void ProtocolBridge::handle_request(const json & request) {
    const json        id     = request["id"];
    const std::string method = request["method"].get<std::string>();
    const json        params = request.contains("params") ? request["params"] : json();

    RELOADER_LOG_DEBUG("%s: %s (id %s)\n", __func__, method.c_str(), id.dump().c_str());

    try {
        send_result(id, dispatch(id, method, params));
    } catch (const rpc_error & e) {
        send_error(id, e.error());
    } catch (const proxy_error & e) {
        RELOADER_LOG_WARN("%s: %s failed: %s\n", __func__, method.c_str(), e.what());
        send_error(id, e.to_rpc_error());
    } catch (const std::exception & e) {
        RELOADER_LOG_ERROR("%s: %s failed: %s\n", __func__, method.c_str(), e.what());
        send_error(id, {
            {"code", RPC_INTERNAL_ERROR},
            {"message", std::string("Internal error: ") + e.what()}
        });
    }
}

json ProtocolBridge::dispatch(const json & id, const std::string & method, const json & params) {
    if (method == "initialize") {
        return handle_initialize(object_or_empty(params));
    }
    if (method == "ping") {
        return json::object();
    }
    if (method == "tools/list") {
        return mirror_.list_tools_result();
    }
    if (method == "tools/call") {
        return handle_tool_call(id, params);
    }

    try {
        return forward(id, method, params);
    } catch (const rpc_error & e) {
        if (e.is_method_not_found()) {
            json empty = empty_list_result(method);
            if (!empty.is_null()) {
                RELOADER_LOG_DEBUG("%s: child does not implement %s, answering with an empty list\n", __func__, method.c_str());
                return empty;
            }
        }
        throw;
    }
}

json ProtocolBridge::handle_initialize(const json & params) {
    const std::string requested = params.value("protocolVersion", "");

    std::string version = protocol_versions[0];
    for (const char * supported : protocol_versions) {
        if (requested == supported) {
            version = requested;
            break;
        }
    }

    const json client_info = object_or_empty(params.value("clientInfo", json::object()));
    RELOADER_LOG_INFO("%s: client '%s' %s connected, protocol %s\n", __func__,
            client_info.value("name", "unknown").c_str(),
            client_info.value("version", "").c_str(),
            version.c_str());

    auto snapshot = mirror_.snapshot();

    json capabilities = {
        {"tools", {
            {"listChanged", true}
        }},
        {"prompts", {
            {"listChanged", true}
        }},
        {"resources", {
            {"subscribe", true},
            {"listChanged", true}
        }},
        {"completions", json::object()},
        {"sampling", json::object()}
    };
    if (snapshot->server_capabilities.contains("logging")) {
        capabilities["logging"] = json::object();
    }

    json result = {
        {"protocolVersion", version},
        {"capabilities", capabilities},
        {"serverInfo", {
            {"name", proxy_server_name(params_)},
            {"version", server_version}
        }}
    };
    if (snapshot->instructions.is_string()) {
        result["instructions"] = snapshot->instructions;
    }

    return result;
}

json ProtocolBridge::handle_tool_call(const json & id, const json & params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw rpc_error({
            {"code", RPC_INVALID_PARAMS},
            {"message", "Missing tool name"}
        });
    }

    if (params["name"] == CapabilityMirror::restart_tool_name()) {
        return handle_restart_tool(params.value("arguments", json::object()));
    }

    return forward(id, "tools/call", params);
}

json ProtocolBridge::handle_restart_tool(const json & arguments) {
    bool force = false;
    if (arguments.is_object() && arguments.contains("force")) {
        if (!arguments["force"].is_boolean()) {
            return text_result("Invalid arguments: 'force' must be a boolean", true);
        }
        force = arguments["force"].get<bool>();
    }

    try {
        restart_outcome outcome = restarts_.restart(force);
        if (outcome.ok) {
            return text_result("Child MCP server restarted successfully. New capabilities have been loaded.", false);
        }
        return text_result("Failed to restart child server: " + outcome.message, true);
    } catch (const proxy_error & e) {
        RELOADER_LOG_WARN("%s: %s\n", __func__, e.what());
        return text_result(std::string("Failed to restart child server: ") + e.what(), true);
    }
}

json ProtocolBridge::forward(const json & id, const std::string & method, const json & params) {
    auto endpoint = supervisor_.current();
    if (!endpoint) {
        std::string message = "child server is not connected";
        switch (restarts_.state()) {
            case RestartState::InProgress: message += ", a restart is in progress"; break;
            case RestartState::Failed:     message += ", use the restart_server tool to start it again"; break;
            case RestartState::Idle:       break;
        }
        throw proxy_error(proxy_errc::child_unavailable, message);
    }

    Client::pending_call call = endpoint->client().call_async(method, params);

    const std::string key = id.dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_[key] = { endpoint, call.id };
    }

    json result;
    try {
        result = endpoint->client().await(call, params_.request_timeout_ms);
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_.erase(key);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    inflight_.erase(key);
    return result;
}

void ProtocolBridge::handle_upstream_notification(const json & notification) {
    const std::string method = notification["method"].get<std::string>();

    if (method == "notifications/initialized") {
        RELOADER_LOG_DEBUG("%s: client initialization completed\n", __func__);
        return;
    }

    const json params = notification.contains("params") ? notification["params"] : json();

    if (method == "notifications/cancelled") {
        const json & p = object_or_empty(params);
        if (!p.contains("requestId")) {
            return;
        }

        inflight_request target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = inflight_.find(p["requestId"].dump());
            if (it == inflight_.end()) {
                RELOADER_LOG_DEBUG("%s: nothing to cancel for request %s\n", __func__, p["requestId"].dump().c_str());
                return;
            }
            target = it->second;
        }

        auto endpoint = target.endpoint.lock();
        if (!endpoint) {
            return;
        }

        json child_params = p;
        child_params["requestId"] = target.child_id;
        try {
            endpoint->client().notify(method, child_params);
        } catch (const std::exception & e) {
            RELOADER_LOG_DEBUG("%s: could not relay cancellation: %s\n", __func__, e.what());
        }
        return;
    }

    auto endpoint = supervisor_.current();
    if (!endpoint) {
        RELOADER_LOG_DEBUG("%s: dropping %s, no child connected\n", __func__, method.c_str());
        return;
    }

    try {
        endpoint->client().notify(method, params);
    } catch (const std::exception & e) {
        RELOADER_LOG_WARN("%s: failed to relay %s: %s\n", __func__, method.c_str(), e.what());
    }
}

void ProtocolBridge::handle_upstream_response(const json & response) {
    relayed_request target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prune_relayed(supervisor_.generation());

        auto it = relayed_.find(response["id"].dump());
        if (it == relayed_.end()) {
            RELOADER_LOG_WARN("%s: response for unknown request %s\n", __func__, response["id"].dump().c_str());
            return;
        }
        target = it->second;
        relayed_.erase(it);
    }

    auto endpoint = supervisor_.endpoint(target.generation);
    if (!endpoint) {
        RELOADER_LOG_DEBUG("%s: child of request %s is gone, dropping the response\n", __func__, response["id"].dump().c_str());
        return;
    }

    try {
        if (response.contains("error")) {
            endpoint->client().send_error(target.child_id, response["error"]);
        } else {
            endpoint->client().send_result(target.child_id, response["result"]);
        }
    } catch (const std::exception & e) {
        RELOADER_LOG_WARN("%s: failed to relay response to the child: %s\n", __func__, e.what());
    }
}

void ProtocolBridge::handle_child_notification(uint64_t generation, const json & notification) {
    // refreshing the tool list waits on the child's reader thread, so never do it here
    if (!notify_lane_.push([this, generation, notification]() { relay_child_notification(generation, notification); })) {
        RELOADER_LOG_DEBUG("%s: dropping child notification during shutdown\n", __func__);
    }
}

void ProtocolBridge::relay_child_notification(uint64_t generation, json notification) {
    if (!supervisor_.endpoint(generation)) {
        return;
    }

    const std::string method = notification.value("method", "");

    if (method == "notifications/tools/list_changed") {
        supervisor_.refresh_capabilities(generation);
    }

    if (method == "notifications/cancelled" && notification.contains("params") && notification["params"].is_object()) {
        json & params = notification["params"];
        if (params.contains("requestId")) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = relayed_.begin(); it != relayed_.end(); ++it) {
                if (it->second.generation == generation && it->second.child_id == params["requestId"]) {
                    // the child gave up on it, an answer would be dropped anyway
                    params["requestId"] = json::parse(it->first);
                    relayed_.erase(it);
                    break;
                }
            }
        }
    }

    send_message(notification);
}

void ProtocolBridge::handle_child_request(uint64_t generation, const json & request) {
    const std::string method = request["method"].get<std::string>();

    auto endpoint = supervisor_.endpoint(generation);

    if (method == "ping") {
        if (endpoint) {
            endpoint->client().send_result(request["id"], json::object());
        }
        return;
    }

    json upstream_request = request;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        prune_relayed(generation);

        const std::string proxy_id = "reloader-" + std::to_string(++relay_counter_);
        upstream_request["id"] = proxy_id;
        relayed_[json(proxy_id).dump()] = { generation, request["id"], std::chrono::steady_clock::now() };
    }

    RELOADER_LOG_DEBUG("%s: relaying %s from the child as %s\n", __func__, method.c_str(), upstream_request["id"].dump().c_str());

    try {
        upstream_.send(upstream_request);
    } catch (const std::exception & e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            relayed_.erase(upstream_request["id"].dump());
        }
        RELOADER_LOG_WARN("%s: failed to relay %s upstream: %s\n", __func__, method.c_str(), e.what());
        if (endpoint) {
            endpoint->client().send_error(request["id"], {
                {"code", RPC_INTERNAL_ERROR},
                {"message", "client is not reachable"}
            });
        }
    }
}

void ProtocolBridge::notify_upstream(const std::string & method) {
    send_message({
        {"jsonrpc", "2.0"},
        {"method", method}
    });
}

size_t ProtocolBridge::inflight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.size();
}

size_t ProtocolBridge::relayed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return relayed_.size();
}

void ProtocolBridge::prune_relayed(uint64_t live_generation) {
    const auto now     = std::chrono::steady_clock::now();
    const auto max_age = std::chrono::milliseconds(params_.request_timeout_ms);

    for (auto it = relayed_.begin(); it != relayed_.end(); ) {
        // requests from replaced children can never be answered, the child has given up on old ones
        if (it->second.generation != live_generation || now - it->second.relayed_at > max_age) {
            RELOADER_LOG_DEBUG("%s: forgetting relayed request %s\n", __func__, it->first.c_str());
            it = relayed_.erase(it);
        } else {
            ++it;
        }
    }
}

void ProtocolBridge::send_message(const json & message) {
    try {
        upstream_.send(message);
    } catch (const std::exception & e) {
        RELOADER_LOG_WARN("%s: failed to write to the client: %s\n", __func__, e.what());
    }
}

void ProtocolBridge::send_result(const json & id, const json & result) {
    send_message({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    });
}

void ProtocolBridge::send_error(const json & id, const json & error) {
    send_message({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    });
}

} // namespace reloader
