#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>
#include "mesh/tool_registry.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::mesh {

struct DispatcherOptions {
    std::chrono::milliseconds call_timeout{30000};
    std::size_t max_in_flight = 4;
};

// Runs one reasoning turn's batch of tool calls. Never fails: every problem
// becomes a ToolResult with success=false, and results[i] answers calls[i].
class Dispatcher {
public:
    explicit Dispatcher(DispatcherOptions options = {});

    std::vector<protocol::ToolResult> execute(
        const ToolRegistry& registry, const std::vector<protocol::ToolCall>& calls,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    const DispatcherOptions& options() const { return options_; }

private:
    protocol::ToolResult execute_one(const ToolRegistry& registry, const protocol::ToolCall& call,
                                     const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    DispatcherOptions options_;
};

}  // namespace fabric::mesh
