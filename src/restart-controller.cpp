#include "restart-controller.hpp"

#include "log.hpp"
#include "proxy-error.hpp"

#include <algorithm>

namespace reloader {

namespace {

const char * list_changed_notifications[] = {
    "notifications/tools/list_changed",
    "notifications/prompts/list_changed",
    "notifications/resources/list_changed",
};

} // namespace

const char * restart_state_name(RestartState state) {
    switch (state) {
        case RestartState::Idle:       return "idle";
        case RestartState::InProgress: return "in-progress";
        case RestartState::Failed:     return "failed";
    }
    return "unknown";
}

RestartController::RestartController(const proxy_params & params, ChildSupervisor & supervisor)
    : params_(params), supervisor_(supervisor) {
    worker_ = std::thread(&RestartController::run, this);
}

RestartController::~RestartController() {
    shutdown();
}

int RestartController::backoff_ms(int delay_ms, size_t n) {
    const int factor = 1 << std::min<size_t>(n, 3);
    return delay_ms * factor;
}

void RestartController::start_initial() {
    supervisor_.start(clock::now() + std::chrono::milliseconds(params_.restart_timeout_ms));

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RestartState::Idle;
}

restart_outcome RestartController::restart(bool force) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            throw proxy_error(proxy_errc::child_unavailable, "proxy is shutting down");
        }
        if (state_ == RestartState::InProgress) {
            throw proxy_error(proxy_errc::restart_conflict, "a restart is already in progress");
        }
        state_                    = RestartState::InProgress;
        pending_auto_             = false;
        deferred_exit_generation_ = 0;
    }
    cv_.notify_all();

    RELOADER_LOG_INFO("%s: restarting child server%s\n", __func__, force ? " (force)" : "");

    try {
        supervisor_.start(clock::now() + std::chrono::milliseconds(params_.restart_timeout_ms), force);
    } catch (const std::exception & e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_                    = RestartState::Failed;
            deferred_exit_generation_ = 0;
        }
        RELOADER_LOG_ERROR("%s: restart failed: %s\n", __func__, e.what());

        restart_outcome outcome;
        outcome.message = e.what();
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_    = RestartState::Idle;
        attempts_ = 0;
        history_.clear();
        handle_deferred_exit();
    }

    RELOADER_LOG_INFO("%s: child server restarted\n", __func__);
    notify_list_changed();

    restart_outcome outcome;
    outcome.ok = true;
    return outcome;
}

void RestartController::on_child_exit(uint64_t generation, const std::string & reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutting_down_) {
        return;
    }
    // a restart completed while this report was on its way
    if (generation != supervisor_.generation()) {
        return;
    }
    // the child published by the running restart died before the restart finished
    if (state_ == RestartState::InProgress) {
        deferred_exit_generation_ = generation;
        deferred_exit_reason_     = reason;
        return;
    }

    handle_exit(reason);
}

void RestartController::handle_deferred_exit() {
    const uint64_t generation = deferred_exit_generation_;
    deferred_exit_generation_ = 0;

    if (generation == 0 || shutting_down_ || generation != supervisor_.generation()) {
        return;
    }
    handle_exit(deferred_exit_reason_);
}

void RestartController::handle_exit(const std::string & reason) {
    if (!params_.auto_restart) {
        state_ = RestartState::Failed;
        RELOADER_LOG_ERROR("%s: child %s, automatic restart is disabled; use restart_server to bring it back\n",
                __func__, reason.c_str());
        return;
    }

    const auto now = clock::now();
    prune_history(now);

    if ((int) history_.size() >= params_.max_restarts) {
        state_ = RestartState::Failed;
        RELOADER_LOG_ERROR("%s: child %s, giving up after %zu restarts within %d ms; use restart_server to bring it back\n",
                __func__, reason.c_str(), history_.size(), params_.restart_window_ms);
        return;
    }

    RELOADER_LOG_WARN("%s: child %s\n", __func__, reason.c_str());
    schedule(now);
}

void RestartController::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        pending_auto_  = false;
    }
    cv_.notify_all();

    supervisor_.shutdown();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

RestartState RestartController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int RestartController::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

size_t RestartController::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void RestartController::prune_history(clock::time_point now) {
    const auto window = std::chrono::milliseconds(params_.restart_window_ms);
    while (!history_.empty() && now - history_.front() > window) {
        history_.pop_front();
    }
}

void RestartController::schedule(clock::time_point now) {
    const int delay = backoff_ms(params_.restart_delay_ms, history_.size());

    due_          = now + std::chrono::milliseconds(delay);
    pending_auto_ = true;
    cv_.notify_all();

    RELOADER_LOG_INFO("%s: restarting in %d ms (attempt %zu of %d)\n", __func__,
            delay, history_.size() + 1, params_.max_restarts);
}

void RestartController::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] { return shutting_down_ || pending_auto_; });
        if (shutting_down_) {
            return;
        }

        // woken early by shutdown or by a manual restart taking over
        if (cv_.wait_until(lock, due_, [this] { return shutting_down_ || !pending_auto_; })) {
            continue;
        }

        pending_auto_             = false;
        state_                    = RestartState::InProgress;
        deferred_exit_generation_ = 0;
        history_.push_back(clock::now());
        attempts_++;
        const size_t attempt = history_.size();

        lock.unlock();

        bool        ok = true;
        std::string error;
        try {
            supervisor_.start(clock::now() + std::chrono::milliseconds(params_.restart_timeout_ms));
        } catch (const std::exception & e) {
            ok    = false;
            error = e.what();
        }

        if (ok) {
            RELOADER_LOG_INFO("%s: child server restarted automatically (attempt %zu)\n", __func__, attempt);
            lock.lock();
            state_ = RestartState::Idle;
            handle_deferred_exit();
            lock.unlock();

            notify_list_changed();

            lock.lock();
            continue;
        }

        lock.lock();
        deferred_exit_generation_ = 0;
        if (shutting_down_) {
            return;
        }

        const auto now = clock::now();
        prune_history(now);

        if (params_.auto_restart && (int) history_.size() < params_.max_restarts) {
            state_ = RestartState::Idle;
            RELOADER_LOG_WARN("%s: automatic restart failed: %s\n", __func__, error.c_str());
            schedule(now);
        } else {
            state_ = RestartState::Failed;
            RELOADER_LOG_ERROR("%s: automatic restart failed: %s; lost the child server after %zu attempts, "
                    "use restart_server to bring it back\n", __func__, error.c_str(), history_.size());
        }
    }
}

void RestartController::notify_list_changed() {
    if (!notifier_) {
        return;
    }
    for (const char * method : list_changed_notifications) {
        try {
            notifier_(method);
        } catch (const std::exception & e) {
            RELOADER_LOG_WARN("%s: failed to send %s: %s\n", __func__, method, e.what());
        }
    }
}

} // namespace reloader
