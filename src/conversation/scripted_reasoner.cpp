#include "conversation/scripted_reasoner.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace fabric::conversation {

using core::errors::ErrorCategory;
using core::errors::FabricError;

ScriptedReasoner::ScriptedReasoner(std::vector<protocol::ReasonerOutput> turns)
    : turns_(std::move(turns)) {}

core::errors::Result<std::unique_ptr<ScriptedReasoner>> ScriptedReasoner::from_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return FabricError{ErrorCategory::Input, "Cannot open script file: " + path.string(),
                           "script_open_failed"};
    }

    nlohmann::json payload = nlohmann::json::parse(in, nullptr, false);
    if (payload.is_discarded() || !payload.is_array()) {
        return FabricError{ErrorCategory::Input,
                           "Script file must hold a JSON array: " + path.string(),
                           "invalid_script"};
    }

    std::vector<protocol::ReasonerOutput> turns;
    for (const auto& entry : payload) {
        auto output = protocol::reasoner_output_from_json(entry);
        if (core::errors::is_error(output)) {
            auto error = core::errors::get_error(output);
            error.category = ErrorCategory::Input;
            error.code = "invalid_script";
            return error;
        }
        turns.push_back(core::errors::get_value(output));
    }
    return std::make_unique<ScriptedReasoner>(std::move(turns));
}

core::errors::Result<protocol::ReasonerOutput> ScriptedReasoner::reason(
    const std::vector<protocol::Message>& /*history*/,
    const std::vector<protocol::ToolDescriptor>& /*catalog*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_turn_ >= turns_.size()) {
        return FabricError{ErrorCategory::Reasoner,
                           "Script exhausted after " + std::to_string(turns_.size()) + " turns.",
                           "script_exhausted"};
    }
    return turns_[next_turn_++];
}

std::size_t ScriptedReasoner::turns_taken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_turn_;
}

}  // namespace fabric::conversation
