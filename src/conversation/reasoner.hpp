#pragma once

#include <vector>
#include "core/errors/fabric_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::conversation {

// The reasoning collaborator. It has no memory between calls: every turn gets
// the full history and the full catalog.
class Reasoner {
public:
    virtual ~Reasoner() = default;

    virtual core::errors::Result<protocol::ReasonerOutput> reason(
        const std::vector<protocol::Message>& history,
        const std::vector<protocol::ToolDescriptor>& catalog) = 0;
};

}  // namespace fabric::conversation
