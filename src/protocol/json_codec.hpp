#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::protocol {

nlohmann::json descriptor_to_json(const ToolDescriptor& descriptor);
nlohmann::json catalog_to_json(const std::vector<ToolDescriptor>& catalog);
nlohmann::json tool_call_to_json(const ToolCall& call);
nlohmann::json tool_result_to_json(const ToolResult& result);
nlohmann::json message_to_json(const Message& message);
nlohmann::json history_to_json(const std::vector<Message>& history);

// Single-line serialization that never throws on invalid UTF-8: bad bytes
// become U+FFFD. Use for anything carrying user or worker text.
std::string to_wire(const nlohmann::json& value);

// Accepts {"text": string|null, "tool_calls": [{"id"?, "name", "arguments"?}]}.
// "arguments" may also be a JSON-encoded string.
core::errors::Result<ReasonerOutput> reasoner_output_from_json(const nlohmann::json& payload);

}  // namespace fabric::protocol
