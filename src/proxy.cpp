#include "proxy.hpp"

#include "log.hpp"
#include "stdio-transport.hpp"

namespace reloader {

namespace {

// forwarded requests mostly sit waiting on the child
constexpr size_t n_workers = 16;

// restart_server calls; concurrent ones beyond the first only report a conflict
constexpr size_t n_control = 4;

std::unique_ptr<Transport> stdio_or(std::unique_ptr<Transport> upstream) {
    if (upstream) {
        return upstream;
    }
    return std::make_unique<StdioTransport>();
}

} // namespace

Proxy::Proxy(const proxy_params & params, std::unique_ptr<Transport> upstream)
    : params_(params),
      upstream_(stdio_or(std::move(upstream))),
      supervisor_(params_, mirror_),
      restarts_(params_, supervisor_),
      workers_(n_workers),
      control_lane_(n_control),
      notify_lane_(1),
      bridge_(params_, *upstream_, mirror_, supervisor_, restarts_, workers_, control_lane_, notify_lane_) {
    supervisor_.set_exit_handler([this](uint64_t generation, const std::string & reason) {
        restarts_.on_child_exit(generation, reason);
    });
    supervisor_.set_notification_handler([this](uint64_t generation, const json & notification) {
        bridge_.handle_child_notification(generation, notification);
    });
    supervisor_.set_request_handler([this](uint64_t generation, const json & request) {
        bridge_.handle_child_request(generation, request);
    });
    restarts_.set_notifier([this](const std::string & method) {
        bridge_.notify_upstream(method);
    });
}

Proxy::~Proxy() {
    shutdown();
}

int Proxy::run() {
    RELOADER_LOG_INFO("%s: mcp-reloader %s, child: %s\n", __func__, RELOADER_VERSION, params_.child_command.c_str());

    try {
        restarts_.start_initial();
    } catch (const std::exception & e) {
        if (shutdown_requested_) {
            return 0;
        }
        RELOADER_LOG_ERROR("%s: failed to start the child server: %s\n", __func__, e.what());
        shutdown();
        return 1;
    }

    RELOADER_LOG_INFO("%s: serving %s on stdio\n", __func__, proxy_server_name(params_).c_str());

    json message;
    while (upstream_->receive(message)) {
        try {
            bridge_.handle_message(message);
        } catch (const std::exception & e) {
            RELOADER_LOG_ERROR("%s: error processing message: %s\n", __func__, e.what());
        }
    }

    if (!shutdown_requested_) {
        RELOADER_LOG_INFO("%s: client disconnected, shutting down\n", __func__);
    }
    shutdown();
    return 0;
}

void Proxy::shutdown() {
    shutdown_requested_ = true;

    std::call_once(shutdown_once_, [this]() {
        RELOADER_LOG_DEBUG("%s: stopping\n", __func__);

        restarts_.shutdown();
        notify_lane_.stop();
        control_lane_.stop();
        workers_.stop();

        try {
            upstream_->close();
        } catch (const std::exception & e) {
            RELOADER_LOG_WARN("%s: error closing the client connection: %s\n", __func__, e.what());
        }
    });
}

} // namespace reloader
