#pragma once

#include "mcp-transport.hpp"

#include <stdexcept>
#include <string>

namespace reloader {

// JSON-RPC error codes used by the proxy
constexpr int RPC_PARSE_ERROR       = -32700;
constexpr int RPC_INVALID_REQUEST   = -32600;
constexpr int RPC_METHOD_NOT_FOUND  = -32601;
constexpr int RPC_INVALID_PARAMS    = -32602;
constexpr int RPC_INTERNAL_ERROR    = -32603;
constexpr int RPC_CONNECTION_CLOSED = -32000;
constexpr int RPC_REQUEST_TIMEOUT   = -32001;

enum class proxy_errc {
    child_unavailable,
    child_spawn_failure,
    capability_query_degraded,
    capability_query_fatal,
    restart_conflict,
    restart_timeout,
    request_timeout,
    invalid_config,
};

const char * proxy_errc_name(proxy_errc code);

// Failure raised by the proxy itself
class proxy_error : public std::runtime_error {
public:
    proxy_error(proxy_errc code, const std::string & message);

    proxy_errc code() const { return code_; }

    // JSON-RPC code reported upstream when this error ends a request
    int rpc_code() const;

    json to_rpc_error() const;

private:
    proxy_errc code_;
};

// Error response returned by a peer, the error object is kept verbatim
class rpc_error : public std::runtime_error {
public:
    explicit rpc_error(const json & error);

    int          code()  const;
    const json & error() const { return error_; }

    bool is_method_not_found() const { return code() == RPC_METHOD_NOT_FOUND; }

private:
    json error_;
};

} // namespace reloader
