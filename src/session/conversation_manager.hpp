#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/fabric_errors.hpp"

namespace fabric::session {

enum class ConversationStatus {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(ConversationStatus status);

struct ConversationRecord {
    std::string conversation_id;
    std::string initial_message;
    ConversationStatus status = ConversationStatus::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks every conversation running against the shared server pool and owns
// their cancellation tokens.
class ConversationManager {
public:
    core::errors::Result<std::string> start_conversation(const std::string& initial_message);
    core::errors::Result<ConversationStatus> cancel(const std::string& conversation_id);
    core::errors::Result<ConversationStatus> get_status(const std::string& conversation_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& conversation_id) const;

    core::errors::Result<ConversationStatus> mark_completed(const std::string& conversation_id);
    core::errors::Result<ConversationStatus> mark_failed(const std::string& conversation_id,
                                                         const std::string& reason);

    // Flips every running conversation's token, e.g. on SIGINT.
    std::size_t cancel_all();

    std::size_t conversation_count() const;

private:
    core::errors::Result<ConversationStatus> transition_to_terminal(
        const std::string& conversation_id, ConversationStatus next_status,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(ConversationStatus status);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConversationRecord> conversations_;
};

}  // namespace fabric::session
