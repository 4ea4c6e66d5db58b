#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "protocol/tool_contract.hpp"

namespace fabric::protocol {

    enum class Role {
        Human,
        Reasoner,
        ToolResult
    };

    // One append-only conversation log entry.
    struct Message {
        Role role;
        std::string content;

        // Reasoner: the zero-or-more invocations it requested this turn.
        std::vector<ToolCall> tool_calls;

        // ToolResult: the outcome of one requested invocation.
        std::optional<protocol::ToolResult> result;
    };

    // What the reasoning collaborator returns for one turn. The core only
    // branches on whether tool_calls is empty.
    struct ReasonerOutput {
        std::optional<std::string> text;
        std::vector<ToolCall> tool_calls;
    };

    inline Message make_human_message(std::string text) {
        return Message{Role::Human, std::move(text), {}, std::nullopt};
    }

    inline Message make_reasoner_message(const ReasonerOutput& output) {
        return Message{Role::Reasoner, output.text.value_or(""), output.tool_calls,
                       std::nullopt};
    }

    inline Message make_tool_result_message(protocol::ToolResult result) {
        std::string content = result.success ? result.output : result.error_message;
        return Message{Role::ToolResult, std::move(content), {}, std::move(result)};
    }

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::Human:
                return "human";
            case Role::Reasoner:
                return "reasoner";
            case Role::ToolResult:
                return "tool_result";
            default:
                return "unknown";
        }
    }

} // namespace fabric::protocol
