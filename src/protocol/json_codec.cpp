#include "protocol/json_codec.hpp"

#include <string>
#include <utility>

namespace fabric::protocol {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using nlohmann::json;

namespace {

FabricError bad_output(const std::string& message) {
    return FabricError{ErrorCategory::Reasoner, message, "malformed_reasoner_output"};
}

}  // namespace

std::string to_wire(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

json descriptor_to_json(const ToolDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.qualified_name;
    payload["server_id"] = descriptor.server_id;
    payload["tool"] = descriptor.name;
    payload["description"] = descriptor.description;
    payload["input_schema"] = descriptor.input_schema;
    return payload;
}

json catalog_to_json(const std::vector<ToolDescriptor>& catalog) {
    json payload = json::array();
    for (const auto& descriptor : catalog) {
        payload.push_back(descriptor_to_json(descriptor));
    }
    return payload;
}

json tool_call_to_json(const ToolCall& call) {
    json payload;
    payload["id"] = call.id;
    payload["name"] = call.name;
    payload["arguments"] = call.arguments;
    return payload;
}

json tool_result_to_json(const ToolResult& result) {
    json payload;
    payload["call_id"] = result.call_id;
    payload["tool_name"] = result.tool_name;
    payload["success"] = result.success;
    payload["output"] = result.output;
    if (!result.structured.is_null()) {
        payload["structured"] = result.structured;
    }
    if (!result.success) {
        payload["error"] = result.error_message;
        payload["error_kind"] = result.error_category.has_value()
                                    ? core::errors::to_string(result.error_category.value())
                                    : "unknown";
    }
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

json message_to_json(const Message& message) {
    json payload;
    payload["role"] = to_string(message.role);
    payload["content"] = message.content;
    if (message.role == Role::Reasoner) {
        json calls = json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back(tool_call_to_json(call));
        }
        payload["tool_calls"] = std::move(calls);
    }
    if (message.result.has_value()) {
        payload["result"] = tool_result_to_json(message.result.value());
    }
    return payload;
}

json history_to_json(const std::vector<Message>& history) {
    json payload = json::array();
    for (const auto& message : history) {
        payload.push_back(message_to_json(message));
    }
    return payload;
}

core::errors::Result<ReasonerOutput> reasoner_output_from_json(const json& payload) {
    if (!payload.is_object()) {
        return bad_output("Reasoner output must be a JSON object.");
    }

    ReasonerOutput output;
    if (payload.contains("text") && !payload["text"].is_null()) {
        if (!payload["text"].is_string()) {
            return bad_output("Reasoner output 'text' must be a string.");
        }
        output.text = payload["text"].get<std::string>();
    }

    if (!payload.contains("tool_calls") || payload["tool_calls"].is_null()) {
        return output;
    }
    if (!payload["tool_calls"].is_array()) {
        return bad_output("Reasoner output 'tool_calls' must be an array.");
    }

    for (const auto& entry : payload["tool_calls"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return bad_output("Each tool call needs a string 'name'.");
        }

        ToolCall call;
        call.name = entry["name"].get<std::string>();
        if (entry.contains("id") && entry["id"].is_string()) {
            call.id = entry["id"].get<std::string>();
        }

        if (entry.contains("arguments")) {
            const auto& arguments = entry["arguments"];
            if (arguments.is_string()) {
                json decoded = json::parse(arguments.get<std::string>(), nullptr, false);
                if (decoded.is_discarded() || !decoded.is_object()) {
                    return bad_output("Tool call '" + call.name +
                                      "' has arguments that are not a JSON object.");
                }
                call.arguments = std::move(decoded);
            } else if (arguments.is_object()) {
                call.arguments = arguments;
            } else if (!arguments.is_null()) {
                return bad_output("Tool call '" + call.name +
                                  "' has arguments that are not a JSON object.");
            }
        }
        output.tool_calls.push_back(std::move(call));
    }
    return output;
}

}  // namespace fabric::protocol
