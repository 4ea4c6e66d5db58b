#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/fabric_errors.hpp"
#include "protocol/message_contract.hpp"

namespace fabric::session {

// Appends one JSON object per line to <transcript_dir>/<conversation_id>.jsonl.
class TranscriptWriter {
public:
    explicit TranscriptWriter(std::filesystem::path transcript_dir);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& conversation_id, const std::string& human_message,
        std::size_t catalog_size) const;

    core::errors::Result<std::filesystem::path> write_message(
        const std::string& conversation_id, const protocol::Message& message) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& conversation_id, const std::string& status,
        const std::string& final_text,
        const std::optional<core::errors::FabricError>& error = std::nullopt) const;

    core::errors::Result<std::filesystem::path> transcript_path(
        const std::string& conversation_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& conversation_id, const std::string& event_json) const;

    std::filesystem::path transcript_dir_;
};

}  // namespace fabric::session
