#include "protocol/rpc_frame.hpp"

#include <utility>
#include "protocol/json_codec.hpp"

namespace fabric::protocol::rpc {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using nlohmann::json;

namespace {

FabricError malformed(const std::string& message) {
    return FabricError{ErrorCategory::Protocol, message, "malformed_frame"};
}

std::string clip(const std::string& text) {
    constexpr std::size_t kMaxEcho = 120;
    if (text.size() <= kMaxEcho) {
        return text;
    }
    return text.substr(0, kMaxEcho) + "...";
}

bool is_text_item(const json& item) {
    return item.is_object() && item.contains("type") && item["type"].is_string() &&
           item["type"].get<std::string>() == "text";
}

}  // namespace

std::string encode_request(const std::int64_t id, const std::string& method,
                           const json& params) {
    json frame = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    frame["params"] = params.is_null() ? json::object() : params;
    return to_wire(frame) + "\n";
}

std::string encode_notification(const std::string& method, const json& params) {
    json frame = {{"jsonrpc", "2.0"}, {"method", method}};
    frame["params"] = params.is_null() ? json::object() : params;
    return to_wire(frame) + "\n";
}

std::string encode_result(const std::int64_t id, const json& result) {
    json frame = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    return to_wire(frame) + "\n";
}

std::string encode_error(const std::int64_t id, const std::int64_t code,
                         const std::string& message) {
    json frame = {{"jsonrpc", "2.0"},
                  {"id", id},
                  {"error", {{"code", code}, {"message", message}}}};
    return to_wire(frame) + "\n";
}

core::errors::Result<Frame> decode_frame(const std::string& line) {
    json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return malformed("Frame is not valid JSON: " + clip(line));
    }
    if (!parsed.is_object()) {
        return malformed("Frame is not a JSON object: " + clip(line));
    }

    Frame frame;
    if (parsed.contains("id") && !parsed["id"].is_null()) {
        const auto& id = parsed["id"];
        if (!id.is_number_integer()) {
            return FabricError{ErrorCategory::Protocol,
                               "Frame id is not an integer: " + clip(to_wire(id)),
                               "unsupported_id"};
        }
        frame.id = id.get<std::int64_t>();
    }

    if (parsed.contains("method")) {
        if (!parsed["method"].is_string()) {
            return malformed("Frame method is not a string: " + clip(line));
        }
        frame.method = parsed["method"].get<std::string>();
        frame.params = parsed.value("params", json::object());
        frame.kind = frame.id.has_value() ? FrameKind::Request : FrameKind::Notification;
        return frame;
    }

    if (!frame.id.has_value()) {
        return malformed("Frame has neither method nor id: " + clip(line));
    }

    frame.kind = FrameKind::Response;
    if (parsed.contains("error") && parsed["error"].is_object()) {
        const auto& body = parsed["error"];
        RpcError error;
        error.message = "unknown error";
        if (body.contains("code") && body["code"].is_number_integer()) {
            error.code = body["code"].get<std::int64_t>();
        }
        if (body.contains("message") && body["message"].is_string()) {
            error.message = body["message"].get<std::string>();
        }
        frame.error = std::move(error);
        return frame;
    }
    if (!parsed.contains("result")) {
        return malformed("Response has neither result nor error: " + clip(line));
    }
    frame.result = std::move(parsed["result"]);
    return frame;
}

json make_initialize_params(const std::string& client_name,
                            const std::string& client_version) {
    return json{{"protocolVersion", kProtocolVersion},
                {"capabilities", json::object()},
                {"clientInfo", {{"name", client_name}, {"version", client_version}}}};
}

core::errors::Result<ToolPage> parse_tool_page(const json& result,
                                               const std::string& server_id) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return FabricError{ErrorCategory::Protocol,
                           "tools/list response from '" + server_id +
                               "' has no tools array.",
                           "malformed_tool_list"};
    }

    ToolPage page;
    for (const auto& entry : result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return FabricError{ErrorCategory::Protocol,
                               "tools/list entry from '" + server_id +
                                   "' has no name: " + clip(to_wire(entry)),
                               "malformed_tool_list"};
        }

        ToolDescriptor descriptor;
        descriptor.name = entry["name"].get<std::string>();
        descriptor.server_id = server_id;
        if (entry.contains("description") && entry["description"].is_string()) {
            descriptor.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
            descriptor.input_schema = entry["inputSchema"];
        }
        descriptor.qualified_name = descriptor.name;
        page.tools.push_back(std::move(descriptor));
    }

    if (result.contains("nextCursor") && result["nextCursor"].is_string() &&
        !result["nextCursor"].get<std::string>().empty()) {
        page.next_cursor = result["nextCursor"].get<std::string>();
    }
    return page;
}

void apply_call_result(const json& result, ToolResult& out) {
    std::string text;
    if (result.is_object() && result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (!is_text_item(item)) {
                continue;
            }
            if (!item.contains("text") || !item["text"].is_string()) {
                out.success = false;
                out.error_message = "Tool result has a text item without string text.";
                out.error_category = ErrorCategory::Protocol;
                return;
            }
            if (!text.empty()) {
                text += "\n";
            }
            text += item["text"].get<std::string>();
        }
    } else if (result.is_string()) {
        text = result.get<std::string>();
    }

    if (result.is_object() && result.contains("structuredContent")) {
        out.structured = result["structuredContent"];
    }

    // A non-boolean isError is treated as an error report.
    const bool is_error = result.is_object() && result.contains("isError") &&
                          !(result["isError"].is_boolean() && !result["isError"].get<bool>());
    if (is_error) {
        out.success = false;
        out.error_message = text.empty() ? "Tool reported an error." : text;
        out.error_category = ErrorCategory::Execution;
        return;
    }

    out.success = true;
    out.output = std::move(text);
}

}  // namespace fabric::protocol::rpc
