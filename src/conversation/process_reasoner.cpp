#include "conversation/process_reasoner.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "transport/process_runner.hpp"

namespace fabric::conversation {

using core::errors::ErrorCategory;
using core::errors::FabricError;

namespace {

std::string last_line(const std::string& text) {
    std::size_t end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return "";
    }
    const std::size_t begin = text.find_last_of('\n', end);
    return text.substr(begin == std::string::npos ? 0 : begin + 1,
                       end - (begin == std::string::npos ? 0 : begin + 1) + 1);
}

}  // namespace

ProcessReasoner::ProcessReasoner(ProcessReasonerOptions options)
    : options_(std::move(options)) {}

core::errors::Result<protocol::ReasonerOutput> ProcessReasoner::reason(
    const std::vector<protocol::Message>& history,
    const std::vector<protocol::ToolDescriptor>& catalog) {
    nlohmann::json input;
    input["history"] = protocol::history_to_json(history);
    input["tools"] = protocol::catalog_to_json(catalog);

    transport::ProcessRequest request;
    request.command = options_.command;
    request.stdin_text = protocol::to_wire(input) + "\n";
    request.working_directory = options_.working_directory;
    request.timeout_ms = options_.timeout_ms;

    auto ran = transport::run_process(request);
    if (core::errors::is_error(ran)) {
        auto error = core::errors::get_error(ran);
        error.category = ErrorCategory::Reasoner;
        return error;
    }

    const auto& capture = core::errors::get_value(ran);
    if (capture.timed_out) {
        return FabricError{ErrorCategory::Reasoner,
                           "Reasoner command timed out after " +
                               std::to_string(options_.timeout_ms) + "ms.",
                           "reasoner_timeout"};
    }
    if (capture.exit_code != 0) {
        std::string detail = last_line(capture.stderr_text);
        return FabricError{ErrorCategory::Reasoner,
                           "Reasoner command failed with exit code " +
                               std::to_string(capture.exit_code) +
                               (detail.empty() ? "" : ": " + detail),
                           "reasoner_failed"};
    }
    if (!capture.stderr_text.empty()) {
        LOG_DEBUG("ProcessReasoner stderr: " + last_line(capture.stderr_text));
    }

    nlohmann::json payload = nlohmann::json::parse(capture.stdout_text, nullptr, false);
    if (payload.is_discarded()) {
        return FabricError{ErrorCategory::Reasoner, "Reasoner output is not valid JSON.",
                           "malformed_reasoner_output"};
    }
    return protocol::reasoner_output_from_json(payload);
}

}  // namespace fabric::conversation
