#include "session/conversation_manager.hpp"
#include <utility>
#include "core/config/conversation_id.hpp"
#include "core/logging/logger.hpp"

namespace fabric::session {

using core::errors::ErrorCategory;
using core::errors::FabricError;

namespace {

FabricError not_found(const std::string& conversation_id) {
    return FabricError{ErrorCategory::Input, "Conversation ID not found: " + conversation_id,
                       "conversation_not_found"};
}

}  // namespace

std::string to_string(const ConversationStatus status) {
    switch (status) {
        case ConversationStatus::Created:
            return "created";
        case ConversationStatus::Running:
            return "running";
        case ConversationStatus::Completed:
            return "completed";
        case ConversationStatus::Failed:
            return "failed";
        case ConversationStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool ConversationManager::is_terminal(const ConversationStatus status) {
    return status == ConversationStatus::Completed || status == ConversationStatus::Failed ||
           status == ConversationStatus::Cancelled;
}

core::errors::Result<std::string> ConversationManager::start_conversation(
    const std::string& initial_message) {
    if (initial_message.empty()) {
        return FabricError{ErrorCategory::Input, "A conversation needs an initial message.",
                           "empty_message"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string conversation_id = core::config::generate_conversation_id();
        if (conversations_.find(conversation_id) != conversations_.end()) {
            continue;
        }

        ConversationRecord record;
        record.conversation_id = conversation_id;
        record.initial_message = initial_message;
        record.status = ConversationStatus::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        conversations_.emplace(conversation_id, std::move(record));
        LOG_INFO("ConversationManager: " + conversation_id +
                 " transition created -> running");
        conversations_[conversation_id].status = ConversationStatus::Running;
        return conversation_id;
    }

    return FabricError{ErrorCategory::Internal, "Unable to allocate unique conversation ID.",
                       "conversation_id_generation_failed"};
}

core::errors::Result<ConversationStatus> ConversationManager::cancel(
    const std::string& conversation_id) {
    return transition_to_terminal(conversation_id, ConversationStatus::Cancelled, std::nullopt);
}

core::errors::Result<ConversationStatus> ConversationManager::mark_completed(
    const std::string& conversation_id) {
    return transition_to_terminal(conversation_id, ConversationStatus::Completed, std::nullopt);
}

core::errors::Result<ConversationStatus> ConversationManager::mark_failed(
    const std::string& conversation_id, const std::string& reason) {
    return transition_to_terminal(conversation_id, ConversationStatus::Failed, reason);
}

core::errors::Result<ConversationStatus> ConversationManager::transition_to_terminal(
    const std::string& conversation_id, const ConversationStatus next_status,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }

    if (is_terminal(it->second.status)) {
        return FabricError{ErrorCategory::Input,
                           "Conversation is already terminal: " + to_string(it->second.status),
                           "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.status);
    it->second.status = next_status;
    it->second.failure_reason = failure_reason;
    if (next_status == ConversationStatus::Cancelled) {
        it->second.cancel_token->store(true);
    }
    LOG_INFO("ConversationManager: " + conversation_id + " transition " + prev + " -> " +
             to_string(next_status));
    return it->second.status;
}

core::errors::Result<ConversationStatus> ConversationManager::get_status(
    const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }
    return it->second.status;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> ConversationManager::get_cancel_token(
    const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }
    return it->second.cancel_token;
}

std::size_t ConversationManager::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t cancelled = 0;
    for (auto& [id, record] : conversations_) {
        if (is_terminal(record.status)) {
            continue;
        }
        record.cancel_token->store(true);
        ++cancelled;
    }
    return cancelled;
}

std::size_t ConversationManager::conversation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

}  // namespace fabric::session
