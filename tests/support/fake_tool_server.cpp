// Stand-in tool server for tests: newline-delimited JSON-RPC over stdio.
//
//   fake_tool_server [--name ID] [--tools a,b,...] [--page-size N]
//                    [--handshake-delay-ms N] [--exit-before-handshake]
//
// bad_text and bad_error answer with wrong-typed fields; they are only
// served when named in --tools.

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

std::mutex g_write_mutex;

void write_line(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    const std::string line = text + "\n";
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = write(STDOUT_FILENO, line.data() + written, line.size() - written);
        if (n <= 0) {
            _exit(0);
        }
        written += static_cast<std::size_t>(n);
    }
}

void send_result(const json& id, const json& result) {
    write_line(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump());
}

void send_error(const json& id, int code, const std::string& message) {
    write_line(json{{"jsonrpc", "2.0"},
                    {"id", id},
                    {"error", {{"code", code}, {"message", message}}}}
                   .dump());
}

json text_result(const std::string& text, bool is_error = false) {
    json result = {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

struct Options {
    std::string name = "fake";
    std::set<std::string> tools = {"echo", "add",   "sleep",    "hang", "fail",
                                   "crash", "stray", "list_dir", "env"};
    std::size_t page_size = 0;  // 0 = everything on one page
    int handshake_delay_ms = 0;
    bool exit_before_handshake = false;
};

std::set<std::string> split_tools(const std::string& csv) {
    std::set<std::string> tools;
    std::stringstream stream(csv);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            tools.insert(item);
        }
    }
    return tools;
}

json describe(const std::string& tool, const std::string& server) {
    json schema = {{"type", "object"}, {"properties", json::object()}};
    std::string description;
    if (tool == "echo") {
        description = "Echo the text argument";
        schema["properties"]["text"] = {{"type", "string"}};
    } else if (tool == "add") {
        description = "Add two numbers";
        schema["properties"]["a"] = {{"type", "number"}};
        schema["properties"]["b"] = {{"type", "number"}};
    } else if (tool == "sleep") {
        description = "Answer after ms milliseconds";
        schema["properties"]["ms"] = {{"type", "integer"}};
    } else if (tool == "hang") {
        description = "Never answer";
    } else if (tool == "fail") {
        description = "Report a tool error";
    } else if (tool == "crash") {
        description = "Exit the server";
    } else if (tool == "stray") {
        description = "Emit noise before answering";
    } else if (tool == "list_dir") {
        description = "List a directory";
        schema["properties"]["path"] = {{"type", "string"}};
    } else if (tool == "env") {
        description = "Read an environment variable";
        schema["properties"]["name"] = {{"type", "string"}};
    } else if (tool == "bad_text") {
        description = "Answer with numeric text content";
    } else if (tool == "bad_error") {
        description = "Answer with a string error code";
    }
    return json{{"name", tool},
                {"description", description + " (" + server + ")"},
                {"inputSchema", schema}};
}

void handle_list(const json& id, const json& params, const Options& options) {
    std::vector<std::string> names(options.tools.begin(), options.tools.end());
    std::size_t start = 0;
    if (params.is_object() && params.contains("cursor") && params["cursor"].is_string()) {
        start = static_cast<std::size_t>(std::stoul(params["cursor"].get<std::string>()));
    }
    const std::size_t page = options.page_size == 0 ? names.size() : options.page_size;
    const std::size_t end = std::min(names.size(), start + page);

    json tools = json::array();
    for (std::size_t i = start; i < end; ++i) {
        tools.push_back(describe(names[i], options.name));
    }
    json result = {{"tools", tools}};
    if (end < names.size()) {
        result["nextCursor"] = std::to_string(end);
    }
    send_result(id, result);
}

void handle_call(const json& id, const json& params, const Options& options) {
    const std::string tool = params.value("name", "");
    const json args = params.contains("arguments") && params["arguments"].is_object()
                          ? params["arguments"]
                          : json::object();
    if (options.tools.count(tool) == 0) {
        send_error(id, -32602, "Unknown tool: " + tool);
        return;
    }

    if (tool == "echo") {
        send_result(id, text_result(args.value("text", "")));
    } else if (tool == "add") {
        const double sum = args.value("a", 0.0) + args.value("b", 0.0);
        std::ostringstream text;
        text << sum;
        json result = text_result(text.str());
        result["structuredContent"] = {{"sum", sum}};
        send_result(id, result);
    } else if (tool == "sleep") {
        const int ms = args.value("ms", 100);
        std::thread([id, ms]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            send_result(id, text_result("slept " + std::to_string(ms)));
        }).detach();
    } else if (tool == "hang") {
        // never answered
    } else if (tool == "fail") {
        send_result(id, text_result("failure requested", true));
    } else if (tool == "crash") {
        std::cerr << "fake_tool_server: crashing on request" << std::endl;
        _exit(3);
    } else if (tool == "stray") {
        send_result(999999, text_result("nobody asked"));
        write_line("this is not json");
        send_result(id, text_result("stray ok"));
    } else if (tool == "list_dir") {
        std::error_code ec;
        const std::filesystem::path path = args.value("path", ".");
        std::vector<std::string> entries;
        for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
            entries.push_back(entry.path().filename().string());
        }
        if (ec) {
            send_result(id, text_result("cannot list " + path.string(), true));
            return;
        }
        std::sort(entries.begin(), entries.end());
        std::string text;
        for (const auto& entry : entries) {
            text += entry + "\n";
        }
        send_result(id, text_result(text));
    } else if (tool == "env") {
        const char* value = std::getenv(args.value("name", "").c_str());
        send_result(id, text_result(value == nullptr ? "" : value));
    } else if (tool == "bad_text") {
        send_result(id, {{"content", json::array({{{"type", "text"}, {"text", 5}}})}});
    } else if (tool == "bad_error") {
        write_line(json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"error", {{"code", "bad"}, {"message", 42}}}}
                       .dump());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--name" && has_value) {
            options.name = argv[++i];
        } else if (arg == "--tools" && has_value) {
            options.tools = split_tools(argv[++i]);
        } else if (arg == "--page-size" && has_value) {
            options.page_size = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--handshake-delay-ms" && has_value) {
            options.handshake_delay_ms = std::stoi(argv[++i]);
        } else if (arg == "--exit-before-handshake") {
            options.exit_before_handshake = true;
        } else {
            std::cerr << "fake_tool_server: unknown argument " << arg << std::endl;
            return 64;
        }
    }

    if (options.exit_before_handshake) {
        std::cerr << "fake_tool_server: refusing to start" << std::endl;
        return 2;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        const json frame = json::parse(line, nullptr, false);
        if (frame.is_discarded() || !frame.is_object()) {
            continue;
        }
        const std::string method = frame.value("method", "");
        const json params = frame.contains("params") ? frame["params"] : json::object();
        if (!frame.contains("id")) {
            if (method == "notifications/cancelled") {
                std::cerr << "fake_tool_server: cancelled " << params.dump() << std::endl;
            }
            continue;
        }
        const json id = frame["id"];

        if (method == "initialize") {
            if (options.handshake_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(options.handshake_delay_ms));
            }
            send_result(id, {{"protocolVersion", "2024-11-05"},
                             {"capabilities", {{"tools", json::object()}}},
                             {"serverInfo", {{"name", options.name}, {"version", "1.0"}}}});
        } else if (method == "tools/list") {
            handle_list(id, params, options);
        } else if (method == "tools/call") {
            handle_call(id, params, options);
        } else if (method == "ping") {
            send_result(id, json::object());
        } else {
            send_error(id, -32601, "Method not found: " + method);
        }
    }
    // Detached sleepers may still be running; skip static destructors.
    _exit(0);
}
