#include "inspect.hpp"

#include "child-process.hpp"
#include "mcp-client.hpp"
#include "proxy-error.hpp"
#include "proxy-params.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <sys/utsname.h>
#include <unistd.h>

extern char ** environ;

namespace reloader {

namespace {

struct inspect_command {
    const char * name;
    const char * target;  // positional argument, or nullptr
    const char * description;
};

const inspect_command inspect_commands[] = {
    { "server-info",    nullptr,  "server capabilities and info"        },
    { "list-tools",     nullptr,  "list all tools"                      },
    { "call-tool",      "<name>", "call a tool, arguments from --params" },
    { "list-resources", nullptr,  "list all resources"                  },
    { "read-resource",  "<uri>",  "read a resource"                     },
    { "list-prompts",   nullptr,  "list all prompts"                    },
    { "get-prompt",     "<name>", "get a prompt, arguments from --args"  },
    { "ping",           nullptr,  "check that the server responds"      },
};

const inspect_command * find_command(const std::string & name) {
    for (const auto & command : inspect_commands) {
        if (name == command.name) {
            return &command;
        }
    }
    return nullptr;
}

json parse_json_option(const std::string & text, const char * what) {
    if (text.empty()) {
        return json();
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error & e) {
        throw std::runtime_error(std::string("Invalid JSON ") + what + ": " + e.what());
    }
}

} // namespace

bool inspect_params_parse(int argc, char ** argv, int first, inspect_params & params, std::string & error) {
    if (first >= argc) {
        error = "missing inspect subcommand";
        return false;
    }

    params.subcommand = argv[first];
    const inspect_command * command = find_command(params.subcommand);
    if (!command) {
        error = "unknown inspect subcommand: " + params.subcommand;
        return false;
    }

    int i = first + 1;
    if (command->target) {
        if (i >= argc || std::string(argv[i]) == "--" || argv[i][0] == '-') {
            error = params.subcommand + " requires " + command->target;
            return false;
        }
        params.target = argv[i++];
    }

    for (; i < argc; i++) {
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

        bool ok = true;
        if      (arg == "-w" || arg == "--working-dir") { ok = next(params.working_dir); }
        else if (arg == "-q" || arg == "--quiet")       { params.quiet = true; }
        else if (arg == "-p" || arg == "--params")      { ok = next(params.params_json); }
        else if (arg == "-a" || arg == "--args")        { ok = next(params.args_json); }
        else if (arg == "-t" || arg == "--timeout") {
            std::string text;
            ok = next(text);
            if (ok) {
                try {
                    params.timeout_ms = std::stoi(text);
                } catch (const std::exception &) {
                    error = "invalid number for " + arg + ": " + text;
                    return false;
                }
                if (params.timeout_ms <= 0) {
                    error = "timeout must be positive";
                    return false;
                }
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

    error = "child command is required, e.g. -- node server.js";
    return false;
}

void inspect_print_usage(const char * argv0, const inspect_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s inspect <subcommand> [options] -- <command> [args...]\n", argv0);
    fprintf(stderr, "\n");
    fprintf(stderr, "subcommands:\n");
    for (const auto & command : inspect_commands) {
        fprintf(stderr, "  %-15s %-7s %s\n", command.name, command.target ? command.target : "", command.description);
    }
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -w DIR,    --working-dir DIR   [%-7s] working directory of the server\n", params.working_dir.empty() ? "cwd" : params.working_dir.c_str());
    fprintf(stderr, "  -t N,      --timeout N         [%-7d] operation timeout in milliseconds\n", params.timeout_ms);
    fprintf(stderr, "  -q,        --quiet             [%-7s] hide the server's stderr\n",          params.quiet ? "true" : "false");
    fprintf(stderr, "  -p JSON,   --params JSON                 call-tool arguments\n");
    fprintf(stderr, "  -a JSON,   --args JSON                   get-prompt arguments\n");
    fprintf(stderr, "\n");
}

json inspect_run(const inspect_params & params) {
    const json tool_args   = parse_json_option(params.params_json, "parameters");
    const json prompt_args = parse_json_option(params.args_json, "arguments");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params.timeout_ms);
    auto remaining = [&]() {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (ms <= 0) {
            throw proxy_error(proxy_errc::request_timeout, "Operation timed out after " + std::to_string(params.timeout_ms) + "ms");
        }
        return (int) ms;
    };

    child_spec spec;
    spec.command     = params.child_command;
    spec.args        = params.child_args;
    spec.working_dir = params.working_dir;

    Client client(std::make_unique<ChildProcessTransport>(ChildProcess::spawn(spec), 1000));
    const bool quiet = params.quiet;
    client.set_diagnostics_handler([quiet](const std::string & line) {
        if (!quiet) {
            fprintf(stderr, "%s\n", line.c_str());
        }
    });
    client.start();

    client.initialize("mcp-reloader-inspector", RELOADER_VERSION, remaining());
    client.send_initialized();

    const std::string & sub = params.subcommand;
    json result;

    if (sub == "server-info") {
        result = {
            {"protocolVersion", client.initialize_result().value("protocolVersion", "")},
            {"capabilities", client.server_capabilities()},
            {"serverInfo", client.server_info()}
        };
    } else if (sub == "list-tools") {
        result = client.list_tools(remaining());
    } else if (sub == "call-tool") {
        result = client.call_tool(params.target, tool_args.is_null() ? json::object() : tool_args, remaining());
    } else if (sub == "list-resources") {
        result = client.request("resources/list", json::object(), remaining());
    } else if (sub == "read-resource") {
        result = client.request("resources/read", {{"uri", params.target}}, remaining());
    } else if (sub == "list-prompts") {
        result = client.request("prompts/list", json::object(), remaining());
    } else if (sub == "get-prompt") {
        json request = {{"name", params.target}};
        if (!prompt_args.is_null()) {
            request["arguments"] = prompt_args;
        }
        result = client.request("prompts/get", request, remaining());
    } else if (sub == "ping") {
        result = client.request("ping", nullptr, remaining());
    } else {
        throw std::runtime_error("unknown inspect subcommand: " + sub);
    }

    client.close();
    return result;
}

int inspect_main(const inspect_params & params) {
    try {
        json result = inspect_run(params);
        printf("%s\n", result.dump(2).c_str());
        fflush(stdout);
        return 0;
    } catch (const std::exception & e) {
        json error = {{"error", e.what()}};
        fprintf(stderr, "%s\n", error.dump(2).c_str());
        return 1;
    }
}

void info_print(bool verbose) {
    proxy_params params;
    proxy_params_from_env(params);

    printf("mcp-reloader v%s\n", RELOADER_VERSION);
    printf("\n");

    struct utsname un;
    char cwd[4096];

    printf("System Information:\n");
    if (uname(&un) == 0) {
        printf("  Platform: %s %s\n", un.sysname, un.release);
        printf("  Architecture: %s\n", un.machine);
    }
    printf("  Working Directory: %s\n", getcwd(cwd, sizeof(cwd)) ? cwd : "unknown");
    printf("\n");

    printf("Environment Configuration:\n");
    printf("  logLevel: %s\n",       params.log_level.c_str());
    printf("  logFile: %s\n",        params.log_file.empty() ? "none" : params.log_file.c_str());
    printf("  maxRestarts: %d\n",    params.max_restarts);
    printf("  autoRestart: %s\n",    params.auto_restart ? "true" : "false");
    printf("  restartTimeout: %d\n", params.restart_timeout_ms);
    printf("  workingDir: %s\n",     params.working_dir.empty() ? "cwd" : params.working_dir.c_str());
    printf("  debugMode: %s\n",      params.debug_mode ? "true" : "false");

    if (verbose) {
        printf("\n");
        printf("MCP-related Environment Variables:\n");
        for (char ** env = environ; env && *env; ++env) {
            if (strncmp(*env, "MCP", 3) == 0) {
                printf("  %s\n", *env);
            }
        }
    }
}

} // namespace reloader
