#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fabric::protocol {

    enum class Command {
        ListTools,
        Run
    };

    // Validated command-line input. Limits left unset fall back to the config file.
    struct ConversationRequest {
        Command command = Command::Run;
        std::filesystem::path config_file;
        std::string message;
        std::optional<std::string> reasoner_command;
        std::optional<std::filesystem::path> script_file;
        std::optional<uint32_t> max_iterations;
        std::optional<uint32_t> call_timeout_ms;
        std::optional<std::filesystem::path> transcript_dir;
        bool verbose = false;
    };

} // namespace fabric::protocol
