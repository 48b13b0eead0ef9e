#pragma once

#include "mcp-transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace reloader {

// One-shot inspection of an MCP server: spawn, initialize, run a single query, exit.
struct inspect_params {
    std::string subcommand;
    std::string target;       // tool or prompt name, resource uri
    std::string params_json;  // call-tool arguments
    std::string args_json;    // get-prompt arguments

    std::string working_dir;
    int32_t     timeout_ms = 30000;
    bool        quiet      = false;

    std::string              child_command;
    std::vector<std::string> child_args;
};

// argv[first] is the subcommand
bool inspect_params_parse(int argc, char ** argv, int first, inspect_params & params, std::string & error);

void inspect_print_usage(const char * argv0, const inspect_params & params);

// the query result, throws on any failure
json inspect_run(const inspect_params & params);

// prints the result as JSON on stdout or {"error": ...} on stderr, returns the exit code
int inspect_main(const inspect_params & params);

// `info` command: version, platform and the effective environment configuration
void info_print(bool verbose);

} // namespace reloader
