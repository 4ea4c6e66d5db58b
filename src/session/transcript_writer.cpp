#include "session/transcript_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace fabric::session {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& type, const std::string& conversation_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = type;
    event["conversation_id"] = conversation_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

TranscriptWriter::TranscriptWriter(std::filesystem::path transcript_dir)
    : transcript_dir_(std::move(transcript_dir)) {}

core::errors::Result<std::filesystem::path> TranscriptWriter::transcript_path(
    const std::string& conversation_id) const {
    if (conversation_id.empty()) {
        return FabricError{ErrorCategory::Input, "Conversation ID cannot be empty.",
                           "invalid_conversation_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(transcript_dir_, ec);
    if (ec) {
        return FabricError{ErrorCategory::Internal,
                           "Unable to create transcript directory: " + transcript_dir_.string(),
                           "transcript_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(transcript_dir_, ec) || ec) {
        return FabricError{ErrorCategory::Input,
                           "Transcript path is not a directory: " + transcript_dir_.string(),
                           "invalid_transcript_dir"};
    }

    return transcript_dir_ / (conversation_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> TranscriptWriter::append_event(
    const std::string& conversation_id, const std::string& event_json) const {
    auto path_result = transcript_path(conversation_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return FabricError{ErrorCategory::Internal,
                           "Unable to open transcript file: " + path.string(),
                           "transcript_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return FabricError{ErrorCategory::Internal,
                           "Unable to write transcript event: " + path.string(),
                           "transcript_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_request(
    const std::string& conversation_id, const std::string& human_message,
    const std::size_t catalog_size) const {
    json payload;
    payload["message"] = human_message;
    payload["catalog_size"] = catalog_size;
    const json event = make_event("request", conversation_id, std::move(payload));
    return append_event(conversation_id, protocol::to_wire(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_message(
    const std::string& conversation_id, const protocol::Message& message) const {
    const json event = make_event("message", conversation_id, protocol::message_to_json(message));
    return append_event(conversation_id, protocol::to_wire(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_final(
    const std::string& conversation_id, const std::string& status,
    const std::string& final_text, const std::optional<FabricError>& error) const {
    json payload;
    payload["status"] = status;
    payload["final_text"] = final_text;
    if (error.has_value()) {
        payload["error_kind"] = core::errors::to_string(error->category);
        payload["error_code"] = error->code;
        payload["error_message"] = error->message;
    }
    const json event = make_event("final", conversation_id, std::move(payload));
    return append_event(conversation_id, protocol::to_wire(event));
}

}  // namespace fabric::session
