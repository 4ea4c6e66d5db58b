#pragma once
#include <string>
#include <variant>

namespace fabric::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,           // E.g., bad CLI flag or malformed config file
        Launch,          // Worker process could not be spawned or died before handshake
        Protocol,        // Malformed or out-of-protocol frame
        Timeout,         // No response within the deadline
        ConnectionLost,  // Worker exited or its stream closed
        UnknownTool,     // Requested name is not in the catalog
        IterationLimit,  // Conversation exceeded its reasoning/execution cycle budget
        Reasoner,        // Reasoning collaborator failed
        Execution,       // The tool itself reported a failure
        Cancelled,       // Caller cancelled the conversation or batch
        Internal         // E.g., pipe/fork failure or logic bug
    };

    // The standardized error payload
    struct FabricError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the user
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a FabricError.
    template <typename T>
    using Result = std::variant<T, FabricError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<FabricError>(result);
    }

    template <typename T>
    const FabricError& get_error(const Result<T>& result) {
        return std::get<FabricError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // Stable kind names surfaced to users and transcripts.
    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input_error";
            case ErrorCategory::Launch:
                return "launch_error";
            case ErrorCategory::Protocol:
                return "protocol_error";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::ConnectionLost:
                return "connection_lost";
            case ErrorCategory::UnknownTool:
                return "unknown_tool";
            case ErrorCategory::IterationLimit:
                return "iteration_limit_exceeded";
            case ErrorCategory::Reasoner:
                return "reasoner_error";
            case ErrorCategory::Execution:
                return "tool_error";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::Internal:
                return "internal_error";
            default:
                return "unknown";
        }
    }

} // namespace fabric::core::errors
