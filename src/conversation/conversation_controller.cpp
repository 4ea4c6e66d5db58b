#include "conversation/conversation_controller.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace fabric::conversation {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using protocol::Message;

namespace {

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

}  // namespace

std::string to_string(const ConversationPhase phase) {
    switch (phase) {
        case ConversationPhase::Reasoning:
            return "reasoning";
        case ConversationPhase::Executing:
            return "executing";
        case ConversationPhase::Done:
            return "done";
        case ConversationPhase::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

ConversationController::ConversationController(Reasoner& reasoner, CatalogProvider catalog,
                                               const mesh::Dispatcher& dispatcher,
                                               ControllerOptions options)
    : reasoner_(reasoner),
      catalog_(std::move(catalog)),
      dispatcher_(dispatcher),
      options_(options) {}

void ConversationController::append(Message message) {
    state_.history.push_back(std::move(message));
    if (observer_) {
        observer_(state_.history.back());
    }
}

void ConversationController::transition(const ConversationPhase next) {
    LOG_INFO("Conversation: transition " + to_string(state_.phase) + " -> " + to_string(next) +
             " (cycle " + std::to_string(cycles_) + ")");
    state_.phase = next;
}

ConversationOutcome ConversationController::finish(const ConversationPhase phase,
                                                   std::optional<std::string> final_text,
                                                   std::optional<FabricError> error) {
    transition(phase);
    if (error.has_value()) {
        LOG_ERROR("Conversation failed [" + error->code + "]: " + error->message);
    }

    ConversationOutcome outcome;
    outcome.phase = phase;
    outcome.final_text = std::move(final_text);
    outcome.error = std::move(error);
    outcome.history = state_.history;
    outcome.cycles = cycles_;
    return outcome;
}

ConversationOutcome ConversationController::run(const std::string& human_message,
                                                std::shared_ptr<std::atomic_bool> cancel_token) {
    state_ = ConversationState{};
    cycles_ = 0;
    append(protocol::make_human_message(human_message));

    while (true) {
        // Reasoning
        if (is_cancelled(cancel_token)) {
            return finish(ConversationPhase::Failed, std::nullopt,
                          FabricError{ErrorCategory::Cancelled,
                                      "Conversation cancelled before reasoning.", "cancelled"});
        }

        std::shared_ptr<const mesh::ToolRegistry> registry = catalog_ ? catalog_() : nullptr;
        if (!registry) {
            registry = mesh::ToolRegistry::empty();
        }

        auto reasoned = reasoner_.reason(state_.history, registry->describe_all());
        if (core::errors::is_error(reasoned)) {
            FabricError error = core::errors::get_error(reasoned);
            error.category = ErrorCategory::Reasoner;
            return finish(ConversationPhase::Failed, std::nullopt, std::move(error));
        }

        protocol::ReasonerOutput output = std::move(core::errors::get_value(reasoned));
        if (output.tool_calls.empty()) {
            append(protocol::make_reasoner_message(output));
            return finish(ConversationPhase::Done, output.text.value_or(""), std::nullopt);
        }

        if (options_.max_iterations.has_value() && cycles_ >= options_.max_iterations.value()) {
            return finish(ConversationPhase::Failed, std::nullopt,
                          FabricError{ErrorCategory::IterationLimit,
                                      "Iteration limit of " +
                                          std::to_string(options_.max_iterations.value()) +
                                          " reasoning/execution cycles exceeded.",
                                      "iteration_limit_exceeded",
                                      "Raise --max-iterations or refine the request."});
        }

        ++cycles_;
        for (std::size_t i = 0; i < output.tool_calls.size(); ++i) {
            auto& call = output.tool_calls[i];
            if (call.id.empty()) {
                call.id = "call_" + std::to_string(cycles_) + "_" + std::to_string(i + 1);
            }
            state_.pending_tool_calls.insert(call.id);
        }
        append(protocol::make_reasoner_message(output));
        transition(ConversationPhase::Executing);

        // Executing
        auto results = dispatcher_.execute(*registry, output.tool_calls, cancel_token);
        for (auto& result : results) {
            state_.pending_tool_calls.erase(result.call_id);
            append(protocol::make_tool_result_message(std::move(result)));
        }

        if (is_cancelled(cancel_token)) {
            return finish(ConversationPhase::Failed, std::nullopt,
                          FabricError{ErrorCategory::Cancelled,
                                      "Conversation cancelled during tool execution.",
                                      "cancelled"});
        }
        transition(ConversationPhase::Reasoning);
    }
}

}  // namespace fabric::conversation
