#pragma once
#include "core/errors/fabric_errors.hpp"
#include "protocol/conversation_request.hpp"

namespace fabric::app::cli {
    fabric::core::errors::Result<fabric::protocol::ConversationRequest> parse_and_validate(int argc, char* argv[]);
}
