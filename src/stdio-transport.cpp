#include "stdio-transport.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace reloader {

FdLineReader::FdLineReader(int fd) : fd_(fd) {
    if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw std::runtime_error(std::string("failed to create wake pipe: ") + strerror(errno));
    }
}

FdLineReader::~FdLineReader() {
    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
}

bool FdLineReader::read_line(std::string & line) {
    while (true) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            line.assign(buffer_, 0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (interrupted_) {
            return false;
        }

        struct pollfd fds[2] = {
            { fd_,           POLLIN, 0 },
            { wake_pipe_[0], POLLIN, 0 },
        };
        int n = poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            RELOADER_LOG_ERROR("%s: poll failed: %s\n", __func__, strerror(errno));
            return false;
        }
        if (fds[1].revents != 0) {
            return false;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        char chunk[4096];
        ssize_t len = ::read(fd_, chunk, sizeof(chunk));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return false;
        }
        if (len == 0) {
            // a last line without terminator still counts
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return true;
            }
            return false;
        }
        buffer_.append(chunk, len);
    }
}

void FdLineReader::interrupt() {
    if (interrupted_.exchange(true)) {
        return;
    }
    const char byte = 'x';
    if (::write(wake_pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
        RELOADER_LOG_WARN("%s: failed to wake reader: %s\n", __func__, strerror(errno));
    }
}

void write_all(int fd, const std::string & data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("write failed: ") + strerror(errno));
        }
        written += n;
    }
}

FdTransport::FdTransport(int in_fd, int out_fd) : out_fd_(out_fd), reader_(in_fd) {}

void FdTransport::send(const json & message) {
    std::string line = message.dump() + "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        throw std::runtime_error("transport is closed");
    }
    write_all(out_fd_, line);
}

bool FdTransport::receive(json & message) {
    std::string line;
    while (reader_.read_line(line)) {
        if (line.empty()) {
            continue;
        }

        try {
            message = json::parse(line);
            return true;
        } catch (const json::parse_error & e) {
            RELOADER_LOG_WARN("%s: dropping malformed message: %s\n", __func__, e.what());
        }
    }
    return false;
}

void FdTransport::close() {
    {
        // waits for a send in progress, no write starts afterwards
        std::lock_guard<std::mutex> lock(write_mutex_);
        closed_ = true;
    }
    reader_.interrupt();
}

StdioTransport::StdioTransport() : FdTransport(STDIN_FILENO, STDOUT_FILENO) {}

} // namespace reloader
