#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "conversation/reasoner.hpp"

namespace fabric::conversation {

struct ProcessReasonerOptions {
    std::string command;
    std::filesystem::path working_directory;
    std::uint32_t timeout_ms = 120000;
};

// Delegates each turn to an external command: {"history", "tools"} goes in on
// stdin, one reasoner output object comes back on stdout.
class ProcessReasoner : public Reasoner {
public:
    explicit ProcessReasoner(ProcessReasonerOptions options);

    core::errors::Result<protocol::ReasonerOutput> reason(
        const std::vector<protocol::Message>& history,
        const std::vector<protocol::ToolDescriptor>& catalog) override;

private:
    ProcessReasonerOptions options_;
};

}  // namespace fabric::conversation
