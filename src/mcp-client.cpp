#include "mcp-client.hpp"

#include "log.hpp"
#include "proxy-error.hpp"

#include <chrono>
#include <stdexcept>

namespace reloader {

Client::Client(std::unique_ptr<Transport> transport) : transport_(std::move(transport)) {}

Client::~Client() {
    close();
}

void Client::start() {
    open_ = true;
    reader_ = std::thread(&Client::read_loop, this);
    if (transport_->diagnostics()) {
        diagnostics_ = std::thread(&Client::diagnostics_loop, this);
    }
}

void Client::close() {
    if (closing_.exchange(true)) {
        return;
    }

    try {
        transport_->close();
    } catch (const std::exception & e) {
        RELOADER_LOG_WARN("%s: error closing transport: %s\n", __func__, e.what());
    }

    for (std::thread * t : { &reader_, &diagnostics_ }) {
        if (!t->joinable()) {
            continue;
        }
        if (t->get_id() == std::this_thread::get_id()) {
            t->detach();
        } else {
            t->join();
        }
    }

    fail_pending("connection closed");
}

void Client::read_loop() {
    json message;
    while (transport_->receive(message)) {
        try {
            dispatch(message);
        } catch (const std::exception & e) {
            RELOADER_LOG_ERROR("%s: error processing message: %s\n", __func__, e.what());
        }
    }

    fail_pending("connection closed");

    if (!closing_ && on_close_) {
        on_close_();
    }
}

void Client::diagnostics_loop() {
    DiagnosticStream * stream = transport_->diagnostics();
    std::string line;
    while (stream->read_line(line)) {
        if (line.empty()) {
            continue;
        }
        if (on_diagnostics_) {
            on_diagnostics_(line);
        } else {
            RELOADER_LOG_INFO("[child] %s\n", line.c_str());
        }
    }
}

void Client::dispatch(const json & message) {
    if (!message.is_object()) {
        RELOADER_LOG_WARN("%s: ignoring non-object message\n", __func__);
        return;
    }

    const bool has_id = message.contains("id") && !message["id"].is_null();

    if (message.contains("method")) {
        if (has_id) {
            if (on_request_) {
                on_request_(message);
            } else {
                send_error(message["id"], {
                    {"code", RPC_METHOD_NOT_FOUND},
                    {"message", "Method not found"}
                });
            }
        } else if (on_notification_) {
            on_notification_(message);
        }
        return;
    }

    if (!has_id || !message["id"].is_number_integer()) {
        RELOADER_LOG_WARN("%s: ignoring response with unknown id: %s\n", __func__, message.dump().c_str());
        return;
    }

    const int64_t id = message["id"].get<int64_t>();

    std::promise<json> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // timed out or cancelled already
            RELOADER_LOG_DEBUG("%s: late response for request %lld\n", __func__, (long long) id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(message);
}

void Client::fail_pending(const std::string & reason) {
    std::map<int64_t, std::promise<json>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        pending.swap(pending_);
    }
    for (auto & entry : pending) {
        entry.second.set_exception(std::make_exception_ptr(
                proxy_error(proxy_errc::child_unavailable, "child server unavailable: " + reason)));
    }
}

Client::pending_call Client::call_async(const std::string & method, const json & params) {
    pending_call call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw proxy_error(proxy_errc::child_unavailable, "child server unavailable: connection closed");
        }
        call.id = ++request_id_counter_;
        call.response = pending_[call.id].get_future();
    }

    json request = {
        {"jsonrpc", "2.0"},
        {"id", call.id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }

    try {
        transport_->send(request);
    } catch (const std::exception & e) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(call.id);
        throw proxy_error(proxy_errc::child_unavailable, std::string("failed to send request: ") + e.what());
    }

    return call;
}

json Client::await(pending_call & call, int timeout_ms) {
    if (call.response.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned = pending_.erase(call.id) > 0;
        }
        if (abandoned) {
            cancel(call.id, "request timed out");
            throw proxy_error(proxy_errc::request_timeout,
                    "request timed out after " + std::to_string(timeout_ms) + " ms");
        }
        // the response raced the timeout and has been delivered
    }

    json response = call.response.get();
    if (response.contains("error")) {
        throw rpc_error(response["error"]);
    }
    return response.value("result", json::object());
}

json Client::request(const std::string & method, const json & params, int timeout_ms) {
    pending_call call = call_async(method, params);
    return await(call, timeout_ms);
}

void Client::notify(const std::string & method, const json & params) {
    json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    transport_->send(notification);
}

void Client::cancel(int64_t id, const std::string & reason) {
    try {
        notify("notifications/cancelled", {
            {"requestId", id},
            {"reason", reason}
        });
    } catch (const std::exception & e) {
        RELOADER_LOG_DEBUG("%s: could not cancel request %lld: %s\n", __func__, (long long) id, e.what());
    }
}

void Client::send_result(const json & id, const json & result) {
    transport_->send({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    });
}

void Client::send_error(const json & id, const json & error) {
    transport_->send({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    });
}

json Client::initialize(const std::string & client_name, const std::string & client_version, int timeout_ms) {
    json params = {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", {
            {"roots", {
                {"listChanged", true}
            }},
            {"sampling", json::object()},
            {"elicitation", json::object()}
        }},
        {"clientInfo", {
            {"name", client_name},
            {"version", client_version}
        }}
    };

    json result = request("initialize", params, timeout_ms);

    initialize_result_   = result;
    server_info_         = result.value("serverInfo", json::object());
    server_capabilities_ = result.value("capabilities", json::object());

    return result;
}

void Client::send_initialized() {
    notify("notifications/initialized", nullptr);
}

json Client::list_tools(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    json tools = json::array();
    json cursor;

    // follow pagination, bounded so a broken cursor cannot loop forever
    for (int page = 0; page < 100; ++page) {
        json params = json::object();
        if (cursor.is_string()) {
            params["cursor"] = cursor;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            throw proxy_error(proxy_errc::request_timeout, "tools/list timed out");
        }

        json result = request("tools/list", params, (int) remaining);
        if (result.contains("tools") && result["tools"].is_array()) {
            for (const auto & tool : result["tools"]) {
                tools.push_back(tool);
            }
        }

        cursor = result.value("nextCursor", json());
        if (!cursor.is_string() || cursor.get<std::string>().empty()) {
            break;
        }
    }

    return {{"tools", tools}};
}

json Client::call_tool(const std::string & tool_name, const json & arguments, int timeout_ms) {
    return request("tools/call", {
        {"name", tool_name},
        {"arguments", arguments}
    }, timeout_ms);
}

} // namespace reloader
