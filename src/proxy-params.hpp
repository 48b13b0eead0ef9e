#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#ifndef RELOADER_VERSION
#define RELOADER_VERSION "1.0.0"
#endif

namespace reloader {

struct child_spec;

struct proxy_params {
    std::string                        child_command;
    std::vector<std::string>           child_args;
    std::map<std::string, std::string> child_env;
    std::string                        working_dir;

    bool    auto_restart       = true;
    int32_t max_restarts       = 3;
    int32_t restart_delay_ms   = 1000;
    int32_t restart_timeout_ms = 30000;
    int32_t request_timeout_ms = 60000;
    int32_t restart_window_ms  = 300000;
    int32_t shutdown_grace_ms  = 2000;

    std::string log_level  = "info";
    std::string log_file;
    bool        quiet      = false;
    bool        debug_mode = false;
};

constexpr int32_t MAX_RESTARTS_LIMIT = 10;

// MCPDEV_PROXY_* variables, invalid values are logged and ignored
void proxy_params_from_env(proxy_params & params);

// parses argv[first..], everything after "--" is the child command line
bool proxy_params_parse(int argc, char ** argv, int first, proxy_params & params, std::string & error);

// throws proxy_error(invalid_config)
void proxy_params_validate(const proxy_params & params);

void proxy_print_usage(const char * argv0, const proxy_params & params);

child_spec proxy_child_spec(const proxy_params & params);

// basename of the child command without a script extension: "./build/server.js" -> "server-dev", "node ..." -> "node-dev"
std::string proxy_server_name(const proxy_params & params);

} // namespace reloader
