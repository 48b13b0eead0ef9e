#pragma once

#include "stdio-transport.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace reloader {

struct child_spec {
    std::string                        command;
    std::vector<std::string>           args;
    std::map<std::string, std::string> env;  // overrides on top of the inherited environment
    std::string                        working_dir;
};

// A spawned process with its stdin/stdout/stderr connected to pipes.
class ChildProcess {
    struct private_tag {
        explicit private_tag() = default;
    };

public:
    // use spawn()
    explicit ChildProcess(private_tag) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess & operator=(const ChildProcess &) = delete;

    // throws proxy_error(child_spawn_failure) when the pipes, fork, chdir or exec fail
    static std::unique_ptr<ChildProcess> spawn(const child_spec & spec);

    pid_t pid()       const { return pid_; }
    int   stdin_fd()  const { return stdin_fd_; }
    int   stdout_fd() const { return stdout_fd_; }
    int   stderr_fd() const { return stderr_fd_; }

    void close_stdin();

    // reaps the process if it exits within timeout_ms, true once reaped
    bool wait_exit(int timeout_ms);

    // SIGTERM, then SIGKILL after grace_ms (immediately when grace_ms is 0), then reap
    void terminate(int grace_ms);

    bool        exited() const;
    std::string describe_exit() const;

private:
    pid_t              pid_       = -1;
    int                stdin_fd_  = -1;
    int                stdout_fd_ = -1;
    int                stderr_fd_ = -1;
    bool               reaped_    = false;
    int                status_    = 0;
    mutable std::mutex mutex_;
};

// Transport over a child's stdin/stdout, with its stderr declared as diagnostic stream.
class ChildProcessTransport : public FdTransport, public DiagnosticStream {
public:
    ChildProcessTransport(std::unique_ptr<ChildProcess> process, int grace_ms);
    ~ChildProcessTransport() override;

    // closes the child's stdin, terminates it and unblocks both readers
    void close() override;

    // next close() skips the SIGTERM grace period
    void kill_on_close() { grace_ms_ = 0; }

    DiagnosticStream * diagnostics() override { return this; }
    bool read_line(std::string & line) override;

    ChildProcess & process() { return *process_; }

private:
    std::unique_ptr<ChildProcess> process_;
    FdLineReader                  stderr_reader_;
    std::atomic<int>              grace_ms_;
};

} // namespace reloader
