#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace reloader {

// Receives SIGINT and SIGTERM on a dedicated thread, so the handler may lock,
// log and join like any other code.
class SignalWatcher {
public:
    using handler = std::function<void(int signo)>;

    // blocks the watched signals in the calling thread and every thread it starts later,
    // call from main() before any other thread exists
    static void block_signals();

    explicit SignalWatcher(handler fn);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher &) = delete;
    SignalWatcher & operator=(const SignalWatcher &) = delete;

private:
    void run();

    handler           handler_;
    std::atomic<bool> stopping_{false};
    std::thread       thread_;
};

} // namespace reloader
