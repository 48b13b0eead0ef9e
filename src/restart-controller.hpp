#pragma once

#include "child-supervisor.hpp"
#include "proxy-params.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace reloader {

enum class RestartState {
    Idle,
    InProgress,
    Failed,
};

const char * restart_state_name(RestartState state);

struct restart_outcome {
    bool        ok = false;
    std::string message;
};

// Decides when the child is (re)started: on request through the restart tool and
// automatically after a crash, with exponential backoff inside a rolling window.
class RestartController {
public:
    using clock    = std::chrono::steady_clock;
    using notifier = std::function<void(const std::string & method)>;

    RestartController(const proxy_params & params, ChildSupervisor & supervisor);
    ~RestartController();

    RestartController(const RestartController &) = delete;
    RestartController & operator=(const RestartController &) = delete;

    // receives the list_changed notifications emitted after each completed restart
    void set_notifier(notifier fn) { notifier_ = std::move(fn); }

    // first spawn, no notifications; throws what ChildSupervisor::start throws
    void start_initial();

    // throws proxy_error(restart_conflict) while another restart runs,
    // any other failure is reported through the outcome
    restart_outcome restart(bool force);

    // crash report from the supervisor
    void on_child_exit(uint64_t generation, const std::string & reason);

    // cancels pending restarts and stops the child, idempotent
    void shutdown();

    RestartState state() const;
    int          attempts() const;
    size_t       history_size() const;

    // delay_ms * 2^n with the factor capped at 8
    static int backoff_ms(int delay_ms, size_t n);

private:
    void run();
    void notify_list_changed();

    // all expect mutex_ to be held
    void handle_exit(const std::string & reason);
    void handle_deferred_exit();
    void prune_history(clock::time_point now);
    void schedule(clock::time_point now);

    const proxy_params & params_;
    ChildSupervisor &    supervisor_;
    notifier             notifier_;

    mutable std::mutex                  mutex_;
    std::condition_variable             cv_;
    RestartState                        state_         = RestartState::Idle;
    int                                 attempts_      = 0;
    std::deque<clock::time_point>       history_;
    bool                                pending_auto_  = false;
    clock::time_point                   due_;
    bool                                shutting_down_ = false;

    // exit of the current child reported while a restart was still in progress
    uint64_t                            deferred_exit_generation_ = 0;
    std::string                         deferred_exit_reason_;

    std::thread worker_;
};

} // namespace reloader
