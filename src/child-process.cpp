#include "child-process.hpp"

#include "log.hpp"
#include "proxy-error.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char ** environ;

namespace reloader {

namespace {

void close_fd(int & fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string> & overrides) {
    std::vector<std::string> env;
    for (char ** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        std::string key = kv.substr(0, kv.find('='));
        if (overrides.count(key) == 0) {
            env.push_back(kv);
        }
    }
    for (const auto & kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

// only async-signal-safe calls between fork and exec
[[noreturn]] void exec_child(const child_spec & spec, char ** argv, char ** envp,
                             int in_pipe[2], int out_pipe[2], int err_pipe[2], int status_pipe[2]) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT,  SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    // own process group, so terminate() also reaches wrappers like npx or sh -c
    setpgid(0, 0);

    dup2(in_pipe[0],  STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    int err = 0;
    if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
        err = errno;
    } else {
        execvpe(spec.command.c_str(), argv, envp);
        err = errno;
    }

    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void) ignored;
    _exit(127);
}

} // namespace

ChildProcess::~ChildProcess() {
    close_stdin();
    if (!exited()) {
        terminate(0);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const child_spec & spec) {
    if (spec.command.empty()) {
        throw proxy_error(proxy_errc::child_spawn_failure, "no child command given");
    }

    int in_pipe[2]     = { -1, -1 };
    int out_pipe[2]    = { -1, -1 };
    int err_pipe[2]    = { -1, -1 };
    int status_pipe[2] = { -1, -1 };

    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_pipe(in_pipe); close_pipe(out_pipe); close_pipe(err_pipe); close_pipe(status_pipe);
        throw proxy_error(proxy_errc::child_spawn_failure, std::string("failed to create pipes: ") + strerror(err));
    }

    // argv and envp are prepared before fork, the child may not allocate
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(spec.command.c_str()));
    for (const auto & arg : spec.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(spec.env);
    std::vector<char *> envp;
    for (auto & kv : env) {
        envp.push_back(const_cast<char *>(kv.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_pipe(in_pipe); close_pipe(out_pipe); close_pipe(err_pipe); close_pipe(status_pipe);
        throw proxy_error(proxy_errc::child_spawn_failure, std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        exec_child(spec, argv.data(), envp.data(), in_pipe, out_pipe, err_pipe, status_pipe);
    }

    // parent keeps its ends only
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    auto process = std::make_unique<ChildProcess>(private_tag{});
    process->pid_       = pid;
    process->stdin_fd_  = in_pipe[1];
    process->stdout_fd_ = out_pipe[0];
    process->stderr_fd_ = err_pipe[0];

    // the status pipe closes on a successful exec and carries errno otherwise
    int     child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == (ssize_t) sizeof(child_errno)) {
        process->wait_exit(1000);
        throw proxy_error(proxy_errc::child_spawn_failure,
                "failed to start '" + spec.command + "': " + strerror(child_errno));
    }

    RELOADER_LOG_DEBUG("%s: spawned '%s' with pid %d\n", __func__, spec.command.c_str(), (int) pid);

    return process;
}

void ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_fd(stdin_fd_);
}

bool ChildProcess::wait_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reaped_) {
                return true;
            }

            int status = 0;
            pid_t res = waitpid(pid_, &status, WNOHANG);
            if (res == pid_) {
                reaped_ = true;
                status_ = status;
                return true;
            }
            if (res < 0 && errno != EINTR) {
                // already reaped elsewhere, nothing left to wait for
                reaped_ = true;
                return true;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::terminate(int grace_ms) {
    if (exited()) {
        return;
    }

    auto signal_group = [this](int signo) {
        if (kill(-pid_, signo) != 0) {
            kill(pid_, signo);
        }
    };

    if (grace_ms > 0) {
        signal_group(SIGTERM);
        if (wait_exit(grace_ms)) {
            return;
        }
        RELOADER_LOG_WARN("%s: pid %d ignored SIGTERM for %d ms, killing it\n", __func__, (int) pid_, grace_ms);
    }

    signal_group(SIGKILL);
    if (!wait_exit(5000)) {
        RELOADER_LOG_ERROR("%s: pid %d did not exit after SIGKILL\n", __func__, (int) pid_);
    }
}

bool ChildProcess::exited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_;
}

std::string ChildProcess::describe_exit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) {
        return "is still running";
    }
    if (WIFEXITED(status_)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status_));
    }
    if (WIFSIGNALED(status_)) {
        return "was killed by signal " + std::to_string(WTERMSIG(status_)) + " (" + strsignal(WTERMSIG(status_)) + ")";
    }
    return "exited";
}

ChildProcessTransport::ChildProcessTransport(std::unique_ptr<ChildProcess> process, int grace_ms)
    : FdTransport(process->stdout_fd(), process->stdin_fd()),
      process_(std::move(process)),
      stderr_reader_(process_->stderr_fd()),
      grace_ms_(grace_ms) {}

ChildProcessTransport::~ChildProcessTransport() {
    close();
}

void ChildProcessTransport::close() {
    // no send() can be writing to the stdin pipe after this, its fd number is free for reuse
    FdTransport::close();
    process_->close_stdin();
    process_->terminate(grace_ms_);
    stderr_reader_.interrupt();
}

bool ChildProcessTransport::read_line(std::string & line) {
    return stderr_reader_.read_line(line);
}

} // namespace reloader
