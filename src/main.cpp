#include "inspect.hpp"
#include "log.hpp"
#include "proxy-error.hpp"
#include "proxy-params.hpp"
#include "proxy.hpp"
#include "signal-watcher.hpp"

#include <csignal>
#include <cstdio>
#include <string>

using namespace reloader;

namespace {

bool is_help(const std::string & arg) {
    return arg == "-h" || arg == "--help" || arg == "help";
}

bool is_version(const std::string & arg) {
    return arg == "-V" || arg == "--version";
}

int run_inspect(int argc, char ** argv) {
    inspect_params params;

    if (argc > 2 && is_help(argv[2])) {
        inspect_print_usage(argv[0], params);
        return 0;
    }

    std::string error;
    if (!inspect_params_parse(argc, argv, 2, params, error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        inspect_print_usage(argv[0], params);
        return 1;
    }

    // stdout carries the result, keep stderr for the server's own output
    reloader_log_set_level(RELOADER_LOG_LEVEL_ERROR);

    signal(SIGPIPE, SIG_IGN);
    return inspect_main(params);
}

int run_proxy(int argc, char ** argv, int first) {
    proxy_params params;
    proxy_params_from_env(params);

    for (int i = first; i < argc && std::string(argv[i]) != "--"; ++i) {
        if (is_help(argv[i])) {
            proxy_print_usage(argv[0], params);
            return 0;
        }
        if (is_version(argv[i])) {
            printf("%s\n", RELOADER_VERSION);
            return 0;
        }
    }

    std::string error;
    if (!proxy_params_parse(argc, argv, first, params, error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        proxy_print_usage(argv[0], params);
        return 1;
    }

    try {
        proxy_params_validate(params);
    } catch (const proxy_error & e) {
        fprintf(stderr, "error: %s\n", e.what());
        proxy_print_usage(argv[0], params);
        return 1;
    }

    reloader_log_level level = RELOADER_LOG_LEVEL_INFO;
    if (!reloader_log_level_parse(params.log_level, level)) {
        level = RELOADER_LOG_LEVEL_INFO;
    }
    if (params.debug_mode) {
        level = RELOADER_LOG_LEVEL_DEBUG;
    } else if (params.quiet && level < RELOADER_LOG_LEVEL_WARN) {
        level = RELOADER_LOG_LEVEL_WARN;
    }
    reloader_log_set_level(level);

    if (!params.log_file.empty() && !reloader_log_set_file(params.log_file)) {
        fprintf(stderr, "error: cannot open log file '%s'\n", params.log_file.c_str());
        return 1;
    }

    try {
        SignalWatcher::block_signals();
    } catch (const std::exception & e) {
        fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }

    Proxy proxy(params);
    SignalWatcher watcher([&proxy](int /*signo*/) {
        proxy.shutdown();
    });

    return proxy.run();
}

} // namespace

int main(int argc, char ** argv) {
    if (argc < 2) {
        proxy_params params;
        proxy_params_from_env(params);
        proxy_print_usage(argv[0], params);
        return 1;
    }

    const std::string mode = argv[1];

    if (is_help(mode)) {
        proxy_params params;
        proxy_print_usage(argv[0], params);
        return 0;
    }
    if (is_version(mode)) {
        printf("%s\n", RELOADER_VERSION);
        return 0;
    }
    if (mode == "info") {
        const bool verbose = argc > 2 && (std::string(argv[2]) == "-v" || std::string(argv[2]) == "--verbose");
        info_print(verbose);
        return 0;
    }
    if (mode == "inspect") {
        return run_inspect(argc, argv);
    }
    if (mode == "proxy") {
        return run_proxy(argc, argv, 2);
    }

    return run_proxy(argc, argv, 1);
}
