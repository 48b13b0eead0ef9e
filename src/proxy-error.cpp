#include "proxy-error.hpp"

namespace reloader {

namespace {

std::string rpc_error_message(const json & error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump();
}

} // namespace

const char * proxy_errc_name(proxy_errc code) {
    switch (code) {
        case proxy_errc::child_unavailable:         return "ChildUnavailable";
        case proxy_errc::child_spawn_failure:       return "ChildSpawnFailure";
        case proxy_errc::capability_query_degraded: return "CapabilityQueryDegraded";
        case proxy_errc::capability_query_fatal:    return "CapabilityQueryFatal";
        case proxy_errc::restart_conflict:          return "RestartConflict";
        case proxy_errc::restart_timeout:           return "RestartTimeout";
        case proxy_errc::request_timeout:           return "RequestTimeout";
        case proxy_errc::invalid_config:            return "InvalidConfig";
    }
    return "Unknown";
}

proxy_error::proxy_error(proxy_errc code, const std::string & message)
    : std::runtime_error(message), code_(code) {}

int proxy_error::rpc_code() const {
    switch (code_) {
        case proxy_errc::child_unavailable: return RPC_CONNECTION_CLOSED;
        case proxy_errc::request_timeout:
        case proxy_errc::restart_timeout:   return RPC_REQUEST_TIMEOUT;
        default:                            return RPC_INTERNAL_ERROR;
    }
}

json proxy_error::to_rpc_error() const {
    return {
        {"code", rpc_code()},
        {"message", what()},
        {"data", {
            {"reason", proxy_errc_name(code_)}
        }}
    };
}

rpc_error::rpc_error(const json & error)
    : std::runtime_error(rpc_error_message(error)), error_(error) {}

int rpc_error::code() const {
    if (error_.is_object() && error_.contains("code") && error_["code"].is_number_integer()) {
        return error_["code"].get<int>();
    }
    return RPC_INTERNAL_ERROR;
}

} // namespace reloader
