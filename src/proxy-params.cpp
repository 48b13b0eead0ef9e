#include "proxy-params.hpp"

#include "child-process.hpp"
#include "log.hpp"
#include "proxy-error.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace reloader {

namespace {

bool parse_bool(const std::string & value, bool & out) {
    if (value == "true"  || value == "1" || value == "yes" || value == "on")  { out = true;  return true; }
    if (value == "false" || value == "0" || value == "no"  || value == "off") { out = false; return true; }
    return false;
}

bool parse_int(const std::string & value, int32_t & out) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) {
            return false;
        }
        out = v;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

const char * env_value(const char * name) {
    const char * value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

std::string basename_of(const std::string & path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

void proxy_params_from_env(proxy_params & params) {
    if (const char * v = env_value("MCPDEV_PROXY_LOG_LEVEL")) {
        reloader_log_level level;
        if (reloader_log_level_parse(v, level)) {
            params.log_level = v;
        } else {
            RELOADER_LOG_WARN("%s: ignoring MCPDEV_PROXY_LOG_LEVEL=%s\n", __func__, v);
        }
    }
    if (const char * v = env_value("MCPDEV_PROXY_LOG_FILE")) {
        params.log_file = v;
    }
    if (const char * v = env_value("MCPDEV_PROXY_RESTART_LIMIT")) {
        if (!parse_int(v, params.max_restarts)) {
            RELOADER_LOG_WARN("%s: ignoring MCPDEV_PROXY_RESTART_LIMIT=%s\n", __func__, v);
        }
    }
    if (const char * v = env_value("MCPDEV_PROXY_AUTO_RESTART")) {
        if (!parse_bool(v, params.auto_restart)) {
            RELOADER_LOG_WARN("%s: ignoring MCPDEV_PROXY_AUTO_RESTART=%s\n", __func__, v);
        }
    }
    if (const char * v = env_value("MCPDEV_PROXY_TIMEOUT")) {
        if (!parse_int(v, params.restart_timeout_ms)) {
            RELOADER_LOG_WARN("%s: ignoring MCPDEV_PROXY_TIMEOUT=%s\n", __func__, v);
        }
    }
    if (const char * v = env_value("MCPDEV_PROXY_CWD")) {
        params.working_dir = v;
    }
    if (const char * v = env_value("MCPDEV_PROXY_DEBUG_MODE")) {
        if (!parse_bool(v, params.debug_mode)) {
            RELOADER_LOG_WARN("%s: ignoring MCPDEV_PROXY_DEBUG_MODE=%s\n", __func__, v);
        }
    }
}

bool proxy_params_parse(int argc, char ** argv, int first, proxy_params & params, std::string & error) {
    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--") {
            if (i + 1 >= argc) {
                error = "missing child command after --";
                return false;
            }
            params.child_command = argv[i + 1];
            params.child_args.assign(argv + i + 2, argv + argc);
            return true;
        }

        auto next = [&](std::string & value) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };
        auto next_int = [&](int32_t & value) {
            std::string text;
            if (!next(text)) {
                return false;
            }
            if (!parse_int(text, value)) {
                error = "invalid number for " + arg + ": " + text;
                return false;
            }
            return true;
        };

        bool ok = true;
        if      (arg == "-w" || arg == "--working-dir")     { ok = next(params.working_dir); }
        else if (arg == "-l" || arg == "--log-level")       { ok = next(params.log_level); }
        else if (arg == "-f" || arg == "--log-file")        { ok = next(params.log_file); }
        else if (arg == "-t" || arg == "--restart-timeout") { ok = next_int(params.restart_timeout_ms); }
        else if (arg == "-m" || arg == "--max-restarts")    { ok = next_int(params.max_restarts); }
        else if (arg == "-d" || arg == "--restart-delay")   { ok = next_int(params.restart_delay_ms); }
        else if (               arg == "--request-timeout") { ok = next_int(params.request_timeout_ms); }
        else if (               arg == "--restart-window")  { ok = next_int(params.restart_window_ms); }
        else if (               arg == "--no-auto-restart") { params.auto_restart = false; }
        else if (arg == "-q" || arg == "--quiet")           { params.quiet = true; }
        else if (               arg == "--debug")           { params.debug_mode = true; }
        else if (arg == "-e" || arg == "--env") {
            std::string kv;
            ok = next(kv);
            if (ok) {
                size_t eq = kv.find('=');
                if (eq == std::string::npos || eq == 0) {
                    error = "expected KEY=VALUE for " + arg + ": " + kv;
                    return false;
                }
                params.child_env[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
        }
        else {
            error = "unknown argument: " + arg;
            return false;
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

void proxy_params_validate(const proxy_params & params) {
    auto fail = [](const std::string & message) {
        throw proxy_error(proxy_errc::invalid_config, message);
    };

    if (params.child_command.empty()) {
        fail("child command is required, usage: mcp-reloader [options] -- <command> [args...]");
    }
    if (params.max_restarts < 0 || params.max_restarts > MAX_RESTARTS_LIMIT) {
        fail("max restarts must be between 0 and " + std::to_string(MAX_RESTARTS_LIMIT));
    }
    if (params.restart_delay_ms < 0) {
        fail("restart delay must not be negative");
    }
    if (params.restart_timeout_ms <= 0) {
        fail("restart timeout must be positive");
    }
    if (params.request_timeout_ms <= 0) {
        fail("request timeout must be positive");
    }
    if (params.restart_window_ms <= 0) {
        fail("restart window must be positive");
    }

    reloader_log_level level;
    if (!reloader_log_level_parse(params.log_level, level)) {
        fail("unknown log level: " + params.log_level);
    }
}

void proxy_print_usage(const char * argv0, const proxy_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options] -- <command> [args...]\n", argv0);
    fprintf(stderr, "       %s inspect <subcommand> [options] -- <command> [args...]\n", argv0);
    fprintf(stderr, "       %s info [-v]\n", argv0);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,        --help                [default] show this help message and exit\n");
    fprintf(stderr, "  -V,        --version                       print the version and exit\n");
    fprintf(stderr, "  -w DIR,    --working-dir DIR     [%-7s] working directory of the child\n",             params.working_dir.empty() ? "cwd" : params.working_dir.c_str());
    fprintf(stderr, "  -e KV,     --env KEY=VALUE                 extra environment variable for the child\n");
    fprintf(stderr, "  -l LEVEL,  --log-level LEVEL     [%-7s] debug, info, warning, error\n",                params.log_level.c_str());
    fprintf(stderr, "  -f FNAME,  --log-file FNAME      [%-7s] append logs to a file instead of stderr\n",    params.log_file.empty() ? "none" : params.log_file.c_str());
    fprintf(stderr, "  -t N,      --restart-timeout N   [%-7d] restart deadline in milliseconds\n",           params.restart_timeout_ms);
    fprintf(stderr, "  -m N,      --max-restarts N      [%-7d] automatic restarts per window (0 - %d)\n",     params.max_restarts, MAX_RESTARTS_LIMIT);
    fprintf(stderr, "  -d N,      --restart-delay N     [%-7d] delay before an automatic restart in ms\n",   params.restart_delay_ms);
    fprintf(stderr, "             --restart-window N    [%-7d] window for counting automatic restarts in ms\n", params.restart_window_ms);
    fprintf(stderr, "             --request-timeout N   [%-7d] timeout of forwarded requests in ms\n",        params.request_timeout_ms);
    fprintf(stderr, "             --no-auto-restart     [%-7s] do not restart the child when it crashes\n",  params.auto_restart ? "false" : "true");
    fprintf(stderr, "  -q,        --quiet               [%-7s] hide child stderr, only log warnings\n",      params.quiet ? "true" : "false");
    fprintf(stderr, "             --debug               [%-7s] debug logging\n",                             params.debug_mode ? "true" : "false");
    fprintf(stderr, "\n");
    fprintf(stderr, "environment:\n");
    fprintf(stderr, "  MCPDEV_PROXY_LOG_LEVEL, MCPDEV_PROXY_LOG_FILE, MCPDEV_PROXY_RESTART_LIMIT,\n");
    fprintf(stderr, "  MCPDEV_PROXY_AUTO_RESTART, MCPDEV_PROXY_TIMEOUT, MCPDEV_PROXY_CWD, MCPDEV_PROXY_DEBUG_MODE\n");
    fprintf(stderr, "\n");
}

child_spec proxy_child_spec(const proxy_params & params) {
    child_spec spec;
    spec.command     = params.child_command;
    spec.args        = params.child_args;
    spec.env         = params.child_env;
    spec.working_dir = params.working_dir;
    return spec;
}

std::string proxy_server_name(const proxy_params & params) {
    std::string name = basename_of(params.child_command);

    static const char * extensions[] = { ".js", ".ts", ".py", ".rb", ".go" };
    for (const char * ext : extensions) {
        const std::string e = ext;
        if (name.size() > e.size() && name.compare(name.size() - e.size(), e.size(), e) == 0) {
            name.erase(name.size() - e.size());
            break;
        }
    }

    if (name.empty()) {
        name = "mcp-server";
    }
    return name + "-dev";
}

} // namespace reloader
