#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "conversation/reasoner.hpp"
#include "core/errors/fabric_errors.hpp"
#include "mesh/dispatcher.hpp"
#include "mesh/tool_registry.hpp"
#include "protocol/message_contract.hpp"

namespace fabric::conversation {

enum class ConversationPhase {
    Reasoning,
    Executing,
    Done,
    Failed
};

std::string to_string(ConversationPhase phase);

struct ConversationState {
    std::vector<protocol::Message> history;  // append-only
    std::set<std::string> pending_tool_calls;
    ConversationPhase phase = ConversationPhase::Reasoning;
};

struct ControllerOptions {
    // Maximum Reasoning -> Executing cycles; unset means unbounded.
    std::optional<std::uint32_t> max_iterations;
};

struct ConversationOutcome {
    ConversationPhase phase = ConversationPhase::Failed;
    std::optional<std::string> final_text;
    std::optional<core::errors::FabricError> error;
    std::vector<protocol::Message> history;
    std::uint32_t cycles = 0;
};

// Supplies the catalog snapshot for a turn; called once per Reasoning step.
using CatalogProvider = std::function<std::shared_ptr<const mesh::ToolRegistry>()>;
using MessageObserver = std::function<void(const protocol::Message&)>;

// Alternates reasoning and tool execution until the reasoner answers without
// tool calls, the reasoner fails, the iteration limit trips or the caller cancels.
class ConversationController {
public:
    ConversationController(Reasoner& reasoner, CatalogProvider catalog,
                           const mesh::Dispatcher& dispatcher, ControllerOptions options = {});

    ConversationOutcome run(const std::string& human_message,
                            std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Called for every message appended to the history, in order.
    void set_observer(MessageObserver observer) { observer_ = std::move(observer); }

    const ConversationState& state() const { return state_; }

private:
    void append(protocol::Message message);
    void transition(ConversationPhase next);
    ConversationOutcome finish(ConversationPhase phase, std::optional<std::string> final_text,
                               std::optional<core::errors::FabricError> error);

    Reasoner& reasoner_;
    CatalogProvider catalog_;
    const mesh::Dispatcher& dispatcher_;
    ControllerOptions options_;
    MessageObserver observer_;
    ConversationState state_;
    std::uint32_t cycles_ = 0;
};

}  // namespace fabric::conversation
