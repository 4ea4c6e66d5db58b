#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"

namespace fabric::protocol {

    // What a worker advertises for one capability. Identified by (server_id, name);
    // qualified_name is the globally unique name shown to the reasoning step.
    struct ToolDescriptor {
        std::string name;
        std::string server_id;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
        std::string qualified_name;
    };

    // How the reasoning step asks for a capability to be invoked
    struct ToolCall {
        std::string id;
        std::string name;  // qualified name from the catalog
        nlohmann::json arguments = nlohmann::json::object();
    };

    // One invocation outcome. Failures are data, never exceptions.
    struct ToolResult {
        std::string call_id;
        std::string tool_name;
        bool success = false;
        std::string output;                          // concatenated text content
        nlohmann::json structured;                   // structuredContent, when the worker sends it
        std::string error_message;
        std::optional<core::errors::ErrorCategory> error_category;
        double duration_ms = 0.0;
    };

    inline ToolResult make_failed_result(const ToolCall& call,
                                         const core::errors::FabricError& error,
                                         const double duration_ms = 0.0) {
        ToolResult result;
        result.call_id = call.id;
        result.tool_name = call.name;
        result.success = false;
        result.error_message = error.message;
        result.error_category = error.category;
        result.duration_ms = duration_ms;
        return result;
    }

} // namespace fabric::protocol
