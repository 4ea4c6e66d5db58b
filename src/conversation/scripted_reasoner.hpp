#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>
#include "conversation/reasoner.hpp"

namespace fabric::conversation {

// Replays a fixed sequence of outputs, one per turn.
class ScriptedReasoner : public Reasoner {
public:
    explicit ScriptedReasoner(std::vector<protocol::ReasonerOutput> turns);

    // File format: a JSON array of reasoner outputs,
    // e.g. [{"tool_calls": [{"name": "echo", "arguments": {}}]}, {"text": "done"}].
    static core::errors::Result<std::unique_ptr<ScriptedReasoner>> from_file(const std::filesystem::path& path);

    core::errors::Result<protocol::ReasonerOutput> reason(
        const std::vector<protocol::Message>& history,
        const std::vector<protocol::ToolDescriptor>& catalog) override;

    std::size_t turns_taken() const;

private:
    std::vector<protocol::ReasonerOutput> turns_;
    std::size_t next_turn_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace fabric::conversation
