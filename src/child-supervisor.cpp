#include "child-supervisor.hpp"

#include "log.hpp"
#include "proxy-error.hpp"

namespace reloader {

namespace {

int ms_until(std::chrono::steady_clock::time_point deadline) {
    return (int) std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
}

} // namespace

const char * child_status_name(ChildStatus status) {
    switch (status) {
        case ChildStatus::Disconnected: return "disconnected";
        case ChildStatus::Connecting:   return "connecting";
        case ChildStatus::Connected:    return "connected";
    }
    return "unknown";
}

//
// ChildEndpoint
//

ChildEndpoint::ChildEndpoint(uint64_t generation, std::unique_ptr<Client> client, ChildProcessTransport * transport)
    : generation_(generation), client_(std::move(client)), transport_(transport) {}

ChildEndpoint::~ChildEndpoint() {
    stop(false);
}

pid_t ChildEndpoint::pid() const {
    return transport_->process().pid();
}

void ChildEndpoint::stop(bool force) {
    status_ = ChildStatus::Disconnected;

    if (force) {
        transport_->kill_on_close();
    }

    try {
        client_->close();
    } catch (const std::exception & e) {
        RELOADER_LOG_WARN("%s: error closing child client: %s\n", __func__, e.what());
    }
}

std::string ChildEndpoint::exit_description() {
    transport_->process().wait_exit(500);
    return transport_->process().describe_exit();
}

//
// ChildSupervisor
//

ChildSupervisor::ChildSupervisor(const proxy_params & params, CapabilityMirror & mirror)
    : params_(params), mirror_(mirror) {}

ChildSupervisor::~ChildSupervisor() {
    shutdown();
}

void ChildSupervisor::start(std::chrono::steady_clock::time_point deadline, bool force) {
    stop(force);

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw proxy_error(proxy_errc::child_unavailable, "proxy is shutting down");
        }
        generation = ++generation_counter_;
    }

    RELOADER_LOG_INFO("%s: starting child '%s' (generation %llu)\n", __func__,
            params_.child_command.c_str(), (unsigned long long) generation);

    auto process = ChildProcess::spawn(proxy_child_spec(params_));

    auto transport = std::make_unique<ChildProcessTransport>(std::move(process), params_.shutdown_grace_ms);
    ChildProcessTransport * transport_ptr = transport.get();

    auto client = std::make_unique<Client>(std::move(transport));
    client->set_notification_handler([this, generation](const json & notification) {
        if (on_notification_) {
            on_notification_(generation, notification);
        }
    });
    client->set_request_handler([this, generation](const json & request) {
        if (on_request_) {
            on_request_(generation, request);
        }
    });
    client->set_close_handler([this, generation]() {
        on_client_closed(generation);
    });
    client->set_diagnostics_handler([this](const std::string & line) {
        if (params_.quiet) {
            RELOADER_LOG_DEBUG("[child] %s\n", line.c_str());
        } else {
            RELOADER_LOG_INFO("[child] %s\n", line.c_str());
        }
    });

    auto endpoint = std::make_shared<ChildEndpoint>(generation, std::move(client), transport_ptr);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw proxy_error(proxy_errc::child_unavailable, "proxy is shutting down");
        }
        connecting_ = endpoint;
    }
    endpoint->client().start();

    auto remaining = [&]() {
        int ms = ms_until(deadline);
        if (ms <= 0) {
            throw proxy_error(proxy_errc::restart_timeout,
                    "child did not finish starting within " + std::to_string(params_.restart_timeout_ms) + " ms");
        }
        return ms;
    };

    std::shared_ptr<const CapabilitySnapshot> snapshot;
    try {
        try {
            endpoint->client().initialize("mcp-reloader", RELOADER_VERSION, remaining());
            endpoint->client().send_initialized();
        } catch (const rpc_error & e) {
            throw proxy_error(proxy_errc::child_spawn_failure, std::string("initialize failed: ") + e.what());
        } catch (const proxy_error & e) {
            if (e.code() == proxy_errc::request_timeout) {
                throw proxy_error(proxy_errc::restart_timeout,
                        "child did not answer initialize within " + std::to_string(params_.restart_timeout_ms) + " ms");
            }
            if (e.code() == proxy_errc::child_unavailable) {
                throw proxy_error(proxy_errc::child_spawn_failure,
                        "child " + endpoint->exit_description() + " during initialize");
            }
            throw;
        } catch (const std::runtime_error & e) {
            throw proxy_error(proxy_errc::child_spawn_failure, std::string("handshake failed: ") + e.what());
        }

        snapshot = mirror_.fetch(endpoint->client(), remaining());
    } catch (const std::exception & e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connecting_.reset();
        }
        RELOADER_LOG_ERROR("%s: failed to start child: %s\n", __func__, e.what());
        endpoint->stop(true);
        throw;
    }

    bool published     = false;
    bool shutting_down = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.reset();
        shutting_down = shut_down_;
        if (!shutting_down && endpoint->client().is_open()) {
            endpoint->set_status(ChildStatus::Connected);
            endpoint_ = endpoint;
            mirror_.publish(snapshot);
            published = true;
        }
    }

    if (!published) {
        std::string reason = shutting_down ? "proxy is shutting down" : "child " + endpoint->exit_description() + " during startup";
        endpoint->stop(true);
        throw proxy_error(shutting_down ? proxy_errc::child_unavailable : proxy_errc::child_spawn_failure, reason);
    }

    const std::string name = snapshot->server_info.value("name", std::string("unknown"));
    RELOADER_LOG_INFO("%s: connected to '%s' (pid %d, %zu tools)\n", __func__,
            name.c_str(), (int) endpoint->pid(), snapshot->tools.size());
}

void ChildSupervisor::stop(bool force) {
    std::shared_ptr<ChildEndpoint> endpoint;
    std::shared_ptr<ChildEndpoint> connecting;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoint.swap(endpoint_);
        connecting.swap(connecting_);
        mirror_.clear();
    }

    for (auto & e : { endpoint, connecting }) {
        if (!e) {
            continue;
        }
        RELOADER_LOG_INFO("%s: stopping child (generation %llu, pid %d)%s\n", __func__,
                (unsigned long long) e->generation(), (int) e->pid(), force ? " with SIGKILL" : "");
        e->stop(force);
    }
}

void ChildSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
    }
    stop(false);
}

std::shared_ptr<ChildEndpoint> ChildSupervisor::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (endpoint_ && endpoint_->status() == ChildStatus::Connected) {
        return endpoint_;
    }
    return nullptr;
}

std::shared_ptr<ChildEndpoint> ChildSupervisor::endpoint(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (endpoint_ && endpoint_->generation() == generation) {
        return endpoint_;
    }
    return nullptr;
}

ChildStatus ChildSupervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connecting_) {
        return ChildStatus::Connecting;
    }
    return endpoint_ ? endpoint_->status() : ChildStatus::Disconnected;
}

uint64_t ChildSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_counter_;
}

bool ChildSupervisor::refresh_capabilities(uint64_t generation) {
    auto ep = endpoint(generation);
    if (!ep || ep->status() != ChildStatus::Connected) {
        return false;
    }

    std::shared_ptr<const CapabilitySnapshot> snapshot;
    try {
        snapshot = mirror_.fetch(ep->client(), params_.request_timeout_ms);
    } catch (const proxy_error & e) {
        RELOADER_LOG_WARN("%s: keeping the previous tool list: %s\n", __func__, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (endpoint_ != ep) {
        return false;
    }
    mirror_.publish(snapshot);
    return true;
}

void ChildSupervisor::on_client_closed(uint64_t generation) {
    std::shared_ptr<ChildEndpoint> ep;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!endpoint_ || endpoint_->generation() != generation) {
            return;
        }
        endpoint_->set_status(ChildStatus::Disconnected);
        ep = endpoint_;
    }

    std::string reason = ep->exit_description();
    RELOADER_LOG_WARN("%s: child (generation %llu, pid %d) %s\n", __func__,
            (unsigned long long) generation, (int) ep->pid(), reason.c_str());

    if (on_exit_) {
        on_exit_(generation, reason);
    }
}

} // namespace reloader
