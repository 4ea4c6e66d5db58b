#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::mesh {

enum class ConnectionState {
    Starting,
    Ready,
    Degraded,
    Closed
};

inline std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Starting:
            return "starting";
        case ConnectionState::Ready:
            return "ready";
        case ConnectionState::Degraded:
            return "degraded";
        case ConnectionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

// Anything that owns a set of tools and can invoke them by name. The registry
// and dispatcher only see this seam; ServerConnection is the process-backed one.
class ToolEndpoint {
public:
    virtual ~ToolEndpoint() = default;

    virtual const std::string& server_id() const = 0;
    virtual ConnectionState state() const = 0;

    virtual core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() = 0;

    // Transport failures (Timeout, ConnectionLost, Cancelled, Protocol) are
    // errors; a tool that reports its own failure yields success=false.
    // Implementations must return promptly once cancel_token is set.
    virtual core::errors::Result<protocol::ToolResult> invoke(
        const std::string& name, const nlohmann::json& arguments,
        std::chrono::milliseconds timeout,
        const std::shared_ptr<std::atomic_bool>& cancel_token) = 0;
};

}  // namespace fabric::mesh
