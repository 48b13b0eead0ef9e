#include "signal-watcher.hpp"

#include "log.hpp"

#include <csignal>
#include <cstring>
#include <pthread.h>
#include <stdexcept>
#include <string>

namespace reloader {

namespace {

// SIGUSR1 only wakes the watcher up when it is destroyed
sigset_t watched_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);
    return set;
}

} // namespace

void SignalWatcher::block_signals() {
    sigset_t set = watched_signals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + strerror(rc));
    }
    signal(SIGPIPE, SIG_IGN);
}

SignalWatcher::SignalWatcher(handler fn) : handler_(std::move(fn)) {
    thread_ = std::thread(&SignalWatcher::run, this);
}

SignalWatcher::~SignalWatcher() {
    stopping_ = true;
    if (thread_.joinable()) {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }
}

void SignalWatcher::run() {
    sigset_t set = watched_signals();

    while (!stopping_) {
        int signo = 0;
        if (sigwait(&set, &signo) != 0) {
            RELOADER_LOG_ERROR("%s: sigwait failed\n", __func__);
            return;
        }
        if (stopping_) {
            return;
        }
        if (signo == SIGUSR1) {
            continue;
        }

        RELOADER_LOG_INFO("%s: received %s\n", __func__, strsignal(signo));
        if (handler_) {
            handler_(signo);
        }
    }
}

} // namespace reloader
