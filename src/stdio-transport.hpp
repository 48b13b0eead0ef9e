#pragma once

#include "mcp-transport.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace reloader {

// Buffered line reader over a file descriptor. interrupt() wakes a blocked read_line()
// from another thread through a self-pipe.
class FdLineReader {
public:
    explicit FdLineReader(int fd);
    ~FdLineReader();

    FdLineReader(const FdLineReader &) = delete;
    FdLineReader & operator=(const FdLineReader &) = delete;

    // false at end of file, on a read error or after interrupt()
    bool read_line(std::string & line);
    void interrupt();

private:
    int               fd_;
    int               wake_pipe_[2];
    std::string       buffer_;
    std::atomic<bool> interrupted_{false};
};

// writes the whole buffer, retrying short writes, throws std::runtime_error on failure
void write_all(int fd, const std::string & data);

// Newline-delimited JSON-RPC over a pair of file descriptors. The descriptors are not owned.
class FdTransport : public Transport {
public:
    FdTransport(int in_fd, int out_fd);
    ~FdTransport() override = default;

    void send(const json & message) override;
    bool receive(json & message) override;

    // once this returns no send() writes to out_fd again, so the caller may close it
    void close() override;

    bool is_closed() const { return closed_; }

private:
    int               out_fd_;
    FdLineReader      reader_;
    std::mutex        write_mutex_;
    std::atomic<bool> closed_{false};
};

// The proxy's upstream side: stdin/stdout of this process.
class StdioTransport : public FdTransport {
public:
    StdioTransport();
    ~StdioTransport() override = default;
};

} // namespace reloader
