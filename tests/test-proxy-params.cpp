#undef NDEBUG

#include "log.hpp"
#include "proxy-error.hpp"
#include "proxy-params.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace reloader;

namespace {

// keeps the strings alive for the char ** view
struct argv_builder {
    std::vector<std::string> args;
    std::vector<char *>      ptrs;

    explicit argv_builder(std::vector<std::string> a) : args(std::move(a)) {
        for (auto & s : args) {
            ptrs.push_back(&s[0]);
        }
        ptrs.push_back(nullptr);
    }

    int     argc() const { return (int) args.size(); }
    char ** argv()       { return ptrs.data(); }
};

bool parse(std::vector<std::string> args, proxy_params & params, std::string & error) {
    argv_builder b(std::move(args));
    return proxy_params_parse(b.argc(), b.argv(), 1, params, error);
}

bool throws_invalid_config(const proxy_params & params) {
    try {
        proxy_params_validate(params);
    } catch (const proxy_error & e) {
        return e.code() == proxy_errc::invalid_config;
    }
    return false;
}

void test_defaults() {
    proxy_params params;
    assert(params.auto_restart);
    assert(params.max_restarts       == 3);
    assert(params.restart_delay_ms   == 1000);
    assert(params.restart_timeout_ms == 30000);
    assert(params.request_timeout_ms == 60000);
    assert(params.log_level          == "info");
}

void test_parse_child_command() {
    proxy_params params;
    std::string  error;
    bool ok = parse({ "mcp-reloader", "-m", "5", "-d", "250", "--no-auto-restart", "-e", "A=1=2",
                      "--", "node", "server.js", "--port", "-v" }, params, error);
    assert(ok);
    assert(params.max_restarts     == 5);
    assert(params.restart_delay_ms == 250);
    assert(!params.auto_restart);
    assert(params.child_env.at("A") == "1=2");
    assert(params.child_command    == "node");

    // flags after -- belong to the child
    assert((params.child_args == std::vector<std::string>{ "server.js", "--port", "-v" }));

    proxy_params_validate(params);
}

void test_parse_errors() {
    {
        proxy_params params;
        std::string  error;
        assert(!parse({ "mcp-reloader", "--bogus", "--", "x" }, params, error));
        assert(error.find("--bogus") != std::string::npos);
    }
    {
        proxy_params params;
        std::string  error;
        assert(!parse({ "mcp-reloader", "-m", "lots", "--", "x" }, params, error));
        assert(error.find("invalid number") != std::string::npos);
    }
    {
        proxy_params params;
        std::string  error;
        assert(!parse({ "mcp-reloader", "-t" }, params, error));
        assert(error.find("missing value") != std::string::npos);
    }
    {
        proxy_params params;
        std::string  error;
        assert(!parse({ "mcp-reloader", "-e", "NOEQUALS", "--", "x" }, params, error));
    }
    {
        proxy_params params;
        std::string  error;
        assert(!parse({ "mcp-reloader", "--" }, params, error));
    }
}

void test_validate() {
    proxy_params params;
    assert(throws_invalid_config(params)); // no child command

    params.child_command = "server";
    proxy_params_validate(params);

    params.max_restarts = MAX_RESTARTS_LIMIT + 1;
    assert(throws_invalid_config(params));
    params.max_restarts = 0;
    proxy_params_validate(params);

    params.restart_delay_ms = -1;
    assert(throws_invalid_config(params));
    params.restart_delay_ms = 0;

    params.restart_timeout_ms = 0;
    assert(throws_invalid_config(params));
    params.restart_timeout_ms = 1000;

    params.log_level = "chatty";
    assert(throws_invalid_config(params));
    params.log_level = "warning";
    proxy_params_validate(params);
}

void test_env() {
    setenv("MCPDEV_PROXY_RESTART_LIMIT", "7",       1);
    setenv("MCPDEV_PROXY_AUTO_RESTART",  "false",   1);
    setenv("MCPDEV_PROXY_TIMEOUT",       "1500",    1);
    setenv("MCPDEV_PROXY_CWD",           "/tmp",    1);
    setenv("MCPDEV_PROXY_LOG_LEVEL",     "debug",   1);
    setenv("MCPDEV_PROXY_DEBUG_MODE",    "maybe",   1);

    proxy_params params;
    proxy_params_from_env(params);

    assert(params.max_restarts       == 7);
    assert(!params.auto_restart);
    assert(params.restart_timeout_ms == 1500);
    assert(params.working_dir        == "/tmp");
    assert(params.log_level          == "debug");
    assert(!params.debug_mode); // invalid values are ignored

    // flags win over the environment
    std::string error;
    assert(parse({ "mcp-reloader", "-m", "2", "--", "x" }, params, error));
    assert(params.max_restarts == 2);

    for (const char * name : { "MCPDEV_PROXY_RESTART_LIMIT", "MCPDEV_PROXY_AUTO_RESTART", "MCPDEV_PROXY_TIMEOUT",
                               "MCPDEV_PROXY_CWD", "MCPDEV_PROXY_LOG_LEVEL", "MCPDEV_PROXY_DEBUG_MODE" }) {
        unsetenv(name);
    }
}

void test_server_name() {
    proxy_params params;

    params.child_command = "/usr/local/bin/weather-server";
    assert(proxy_server_name(params) == "weather-server-dev");

    // interpreters name the server, their script arguments do not
    params.child_command = "node";
    params.child_args    = { "echo-server.js" };
    assert(proxy_server_name(params) == "node-dev");

    params.child_command = "python3";
    params.child_args    = { "tools/my_server.py" };
    assert(proxy_server_name(params) == "python3-dev");

    params.child_command = "./server.ts";
    params.child_args    = {};
    assert(proxy_server_name(params) == "server-dev");

    params.child_command = "tools\\my_server.py";
    assert(proxy_server_name(params) == "my_server-dev");

    params.child_command = "/opt/bin/";
    assert(proxy_server_name(params) == "mcp-server-dev");
}

void test_log_levels() {
    reloader_log_level level;
    assert(reloader_log_level_parse("warning", level) && level == RELOADER_LOG_LEVEL_WARN);
    assert(reloader_log_level_parse("critical", level) && level == RELOADER_LOG_LEVEL_ERROR);
    assert(reloader_log_level_parse("debug", level) && level == RELOADER_LOG_LEVEL_DEBUG);
    assert(reloader_log_level_parse("off", level) && level == RELOADER_LOG_LEVEL_NONE);
    assert(!reloader_log_level_parse("loud", level));
}

} // namespace

int main() {
    reloader_log_set_level(RELOADER_LOG_LEVEL_ERROR);

    test_defaults();
    test_parse_child_command();
    test_parse_errors();
    test_validate();
    test_env();
    test_server_name();
    test_log_levels();

    printf("%s: all tests passed\n", __FILE__);
    return 0;
}
