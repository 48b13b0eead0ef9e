#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace reloader {

using json = nlohmann::ordered_json;

// Line-oriented side channel carried next to the message stream (a child's stderr).
// Its content is operator diagnostics, never protocol data.
class DiagnosticStream {
public:
    virtual ~DiagnosticStream() = default;

    // blocks until a complete line is available, false at end of stream
    virtual bool read_line(std::string & line) = 0;
};

// Ordered, reliable stream of JSON-RPC messages, one message per line.
class Transport {
public:
    virtual ~Transport() = default;

    // thread-safe, throws std::runtime_error when the peer is gone
    virtual void send(const json & message) = 0;

    // blocks for the next message, false once the stream has ended or close() was called
    virtual bool receive(json & message) = 0;

    // unblocks receive(), idempotent
    virtual void close() = 0;

    // transports that carry a diagnostic stream declare it here
    virtual DiagnosticStream * diagnostics() { return nullptr; }
};

} // namespace reloader
