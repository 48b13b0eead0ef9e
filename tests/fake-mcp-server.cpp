// Minimal MCP server used by the tests. Behaviour is picked with flags.

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using json = nlohmann::ordered_json;

namespace {

struct fake_params {
    std::vector<std::string> tools = { "echo", "sleep", "crash", "sample", "add_tool" };

    bool no_tools_list    = false;
    bool tools_list_error = false;
    bool fail_init        = false;
    bool prompts          = false;
    bool logging          = false;
    int  init_delay_ms    = 0;
    int  page_size        = 0;

    std::string crash_if_exists;
    std::string instance_file;
    std::string instructions;
};

std::vector<std::string> split(const std::string & s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

bool fake_params_parse(int argc, char ** argv, fake_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if      (arg == "--tools")            { params.tools            = split(argv[++i], ','); }
        else if (arg == "--no-tools-list")    { params.no_tools_list    = true; }
        else if (arg == "--tools-list-error") { params.tools_list_error = true; }
        else if (arg == "--fail-init")        { params.fail_init        = true; }
        else if (arg == "--prompts")          { params.prompts          = true; }
        else if (arg == "--logging")          { params.logging          = true; }
        else if (arg == "--init-delay")       { params.init_delay_ms    = std::stoi(argv[++i]); }
        else if (arg == "--page-size")        { params.page_size        = std::stoi(argv[++i]); }
        else if (arg == "--crash-if-exists")  { params.crash_if_exists  = argv[++i]; }
        else if (arg == "--instance-file")    { params.instance_file    = argv[++i]; }
        else if (arg == "--instructions")     { params.instructions     = argv[++i]; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

class FakeServer {
public:
    explicit FakeServer(const fake_params & params) : params(params), tools(params.tools) {}

    ~FakeServer() {
        for (auto & t : workers) {
            t.join();
        }
    }

    void send_response(const json & response) {
        std::lock_guard<std::mutex> lock(write_mutex);
        printf("%s\n", response.dump().c_str());
        fflush(stdout);
    }

    void send_result(const json & id, const json & result) {
        send_response({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"result", result}
        });
    }

    void send_error(const json & id, int code, const std::string & message) {
        send_response({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        });
    }

    static json text_result(const std::string & text) {
        return {
            {"content", json::array({
                {
                    {"type", "text"},
                    {"text", text}
                }
            })}
        };
    }

    void handle_initialize(const json & id) {
        if (params.init_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(params.init_delay_ms));
        }
        if (params.fail_init) {
            send_error(id, -32603, "initialization refused");
            return;
        }

        json capabilities = {
            {"tools", {
                {"listChanged", true}
            }}
        };
        if (params.prompts) {
            capabilities["prompts"] = json::object();
        }
        if (params.logging) {
            capabilities["logging"] = json::object();
        }

        json result = {
            {"protocolVersion", "2025-06-18"},
            {"capabilities", capabilities},
            {"serverInfo", {
                {"name", "fake-mcp-server"},
                {"version", "0.1.0"}
            }}
        };
        if (!params.instructions.empty()) {
            result["instructions"] = params.instructions;
        }

        send_result(id, result);
    }

    json tool_descriptor(const std::string & name) {
        return {
            {"name", name},
            {"description", "fake tool " + name},
            {"inputSchema", {
                {"type", "object"},
                {"properties", json::object()}
            }}
        };
    }

    void handle_list_tools(const json & id, const json & params_in) {
        if (params.no_tools_list) {
            send_error(id, -32601, "Method not found: tools/list");
            return;
        }
        if (params.tools_list_error) {
            send_error(id, -32603, "tools are broken");
            return;
        }

        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            names = tools;
        }

        size_t start = 0;
        if (params_in.is_object() && params_in.contains("cursor")) {
            start = std::stoul(params_in["cursor"].get<std::string>());
        }
        size_t end = params.page_size > 0 ? std::min(names.size(), start + params.page_size) : names.size();

        json list = json::array();
        for (size_t i = start; i < end; ++i) {
            list.push_back(tool_descriptor(names[i]));
        }

        json result = {{"tools", list}};
        if (end < names.size()) {
            result["nextCursor"] = std::to_string(end);
        }
        send_result(id, result);
    }

    void handle_sleep(const json & id, const json & arguments) {
        const int ms = arguments.value("ms", 100);
        const std::string key = id.dump();

        workers.emplace_back([this, id, key, ms]() {
            std::unique_lock<std::mutex> lock(state_mutex);
            bool cancelled = cancel_cv.wait_for(lock, std::chrono::milliseconds(ms), [&] {
                return cancelled_ids.count(key) > 0;
            });
            lock.unlock();

            send_result(id, text_result(cancelled ? "cancelled" : "slept " + std::to_string(ms)));
        });
    }

    void handle_sample(const json & id, const json & arguments) {
        const std::string sample_id = "sample-" + std::to_string(++sample_counter);
        pending_samples[sample_id] = id;

        send_response({
            {"jsonrpc", "2.0"},
            {"id", sample_id},
            {"method", "sampling/createMessage"},
            {"params", {
                {"messages", json::array({
                    {
                        {"role", "user"},
                        {"content", {
                            {"type", "text"},
                            {"text", arguments.value("prompt", "hello")}
                        }}
                    }
                })},
                {"maxTokens", 16}
            }}
        });
    }

    void handle_add_tool(const json & id) {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            tools.push_back("extra");
        }
        send_response({
            {"jsonrpc", "2.0"},
            {"method", "notifications/tools/list_changed"}
        });
        send_result(id, text_result("added"));
    }

    void handle_tool_call(const json & id, const json & params_in) {
        std::string name = params_in.value("name", "");
        json arguments = params_in.value("arguments", json::object());

        if (name == "echo") {
            send_result(id, text_result(arguments.dump()));
        } else if (name == "sleep") {
            handle_sleep(id, arguments);
        } else if (name == "crash") {
            fprintf(stderr, "crashing on request\n");
            fflush(stderr);
            _exit(3);
        } else if (name == "sample") {
            handle_sample(id, arguments);
        } else if (name == "add_tool") {
            handle_add_tool(id);
        } else {
            send_error(id, -32602, "Unknown tool: " + name);
        }
    }

    void handle_response(const json & response) {
        const std::string key = response["id"].is_string() ? response["id"].get<std::string>() : response["id"].dump();
        auto it = pending_samples.find(key);
        if (it == pending_samples.end()) {
            fprintf(stderr, "unexpected response: %s\n", response.dump().c_str());
            return;
        }
        json id = it->second;
        pending_samples.erase(it);

        if (response.contains("error")) {
            send_result(id, text_result("sampling failed: " + response.at("error").value("message", "")));
            return;
        }
        send_result(id, text_result("sampled: " + response.at("result").at("content").value("text", "")));
    }

    void handle_cancelled(const json & params_in) {
        if (!params_in.is_object() || !params_in.contains("requestId")) {
            return;
        }
        fprintf(stderr, "cancelled %s\n", params_in["requestId"].dump().c_str());
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            cancelled_ids.insert(params_in["requestId"].dump());
        }
        cancel_cv.notify_all();
    }

    void run() {
        fprintf(stderr, "fake MCP server starting (pid %d)\n", (int) getpid());

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;

            try {
                json request = json::parse(line);

                if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
                    continue;
                }

                json id = nullptr;
                if (request.contains("id")) {
                    id = request["id"];
                }

                if (!request.contains("method")) {
                    handle_response(request);
                    continue;
                }

                std::string method = request.value("method", "");
                json params_in = request.value("params", json::object());

                if (method == "initialize") {
                    handle_initialize(id);
                } else if (method == "tools/list") {
                    handle_list_tools(id, params_in);
                } else if (method == "tools/call") {
                    handle_tool_call(id, params_in);
                } else if (method == "prompts/list" && params.prompts) {
                    send_result(id, {{"prompts", json::array({ {{"name", "greeting"}} })}});
                } else if (method == "ping") {
                    send_result(id, json::object());
                } else if (method == "notifications/initialized") {
                    fprintf(stderr, "client initialization completed\n");
                } else if (method == "notifications/cancelled") {
                    handle_cancelled(params_in);
                } else if (id.is_null()) {
                    fprintf(stderr, "notification %s\n", method.c_str());
                } else {
                    send_error(id, -32601, "Method not found: " + method);
                }

            } catch (const json::parse_error & e) {
                fprintf(stderr, "JSON parse error: %s\n", e.what());
            } catch (const std::exception & e) {
                fprintf(stderr, "Error processing request: %s\n", e.what());
            }
        }
    }

private:
    const fake_params & params;

    std::mutex               write_mutex;
    std::mutex               state_mutex;
    std::condition_variable  cancel_cv;
    std::vector<std::string> tools;
    std::set<std::string>    cancelled_ids;
    std::vector<std::thread> workers;

    std::map<std::string, json> pending_samples;
    int                         sample_counter = 0;
};

} // namespace

int main(int argc, char ** argv) {
    fake_params params;
    if (!fake_params_parse(argc, argv, params)) {
        return 2;
    }

    if (!params.instance_file.empty()) {
        std::ofstream out(params.instance_file, std::ios::app);
        out << getpid() << "\n";
    }

    if (!params.crash_if_exists.empty() && access(params.crash_if_exists.c_str(), F_OK) == 0) {
        fprintf(stderr, "refusing to start, %s exists\n", params.crash_if_exists.c_str());
        return 3;
    }

    FakeServer server(params);
    server.run();

    return 0;
}
