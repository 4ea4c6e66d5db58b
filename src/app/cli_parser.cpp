#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace fabric::app::cli {

    using namespace fabric::core::errors;
    using fabric::protocol::Command;
    using fabric::protocol::ConversationRequest;

    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> message;
        std::optional<std::string> reasoner_command;
        std::optional<std::string> script;
        std::optional<std::string> max_iterations;
        std::optional<std::string> call_timeout_ms;
        std::optional<std::string> transcript_dir;
        bool verbose = false;
    };

    namespace {

        const char* kUsage =
            "Usage: toolfabric tools --config FILE | toolfabric run --config FILE --message TEXT "
            "(--reasoner-command CMD | --script FILE)";

        // Exception-free integer parsing; the whole token must be digits.
        Result<uint32_t> parse_uint(const std::string& flag, const std::string& text) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return FabricError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            return value;
        }

        bool takes_value(const std::string& arg) {
            return arg == "--config" || arg == "--message" || arg == "--reasoner-command" ||
                   arg == "--script" || arg == "--max-iterations" || arg == "--call-timeout-ms" ||
                   arg == "--transcript-dir";
        }

        std::optional<std::string>* slot_for(RawCliOptions& raw, const std::string& arg) {
            if (arg == "--config") return &raw.config;
            if (arg == "--message") return &raw.message;
            if (arg == "--reasoner-command") return &raw.reasoner_command;
            if (arg == "--script") return &raw.script;
            if (arg == "--max-iterations") return &raw.max_iterations;
            if (arg == "--call-timeout-ms") return &raw.call_timeout_ms;
            if (arg == "--transcript-dir") return &raw.transcript_dir;
            return nullptr;
        }

    } // namespace

    Result<ConversationRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return FabricError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        ConversationRequest req;
        std::string command = argv[1];
        if (command == "run") {
            req.command = Command::Run;
        } else if (command == "tools") {
            req.command = Command::ListTools;
        } else {
            return FabricError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'tools' and 'run'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // Parser phase: collect raw strings only.
        for (size_t i = 0; i < args.size(); ++i) {
            if (takes_value(args[i])) {
                if (i + 1 >= args.size()) {
                    return FabricError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
                }
                *slot_for(raw, args[i]) = args[i + 1];
                ++i;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return FabricError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // Validator phase.
        req.verbose = raw.verbose;

        if (!raw.config) {
            return FabricError{ErrorCategory::Input, "Must provide --config", "missing_required_flag", kUsage};
        }
        std::filesystem::path config_path(raw.config.value());
        std::error_code path_ec;
        const bool is_file = std::filesystem::is_regular_file(config_path, path_ec);
        if (path_ec || !is_file) {
            return FabricError{ErrorCategory::Input, "Config file does not exist: " + config_path.string(), "invalid_path"};
        }
        req.config_file = std::move(config_path);

        if (req.command == Command::ListTools) {
            if (raw.message || raw.reasoner_command || raw.script || raw.max_iterations ||
                raw.call_timeout_ms || raw.transcript_dir) {
                return FabricError{ErrorCategory::Input, "'tools' only accepts --config and --verbose", "unexpected_flag"};
            }
            return req;
        }

        if (!raw.message || raw.message->empty()) {
            return FabricError{ErrorCategory::Input, "Must provide a non-empty --message", "missing_required_flag", kUsage};
        }
        req.message = raw.message.value();

        // Exactly one reasoner source.
        if (!raw.reasoner_command && !raw.script) {
            return FabricError{ErrorCategory::Input, "Must provide either --reasoner-command or --script", "missing_required_flag"};
        }
        if (raw.reasoner_command && raw.script) {
            return FabricError{ErrorCategory::Input, "Cannot provide both --reasoner-command and --script", "conflicting_flags"};
        }
        if (raw.reasoner_command) {
            if (raw.reasoner_command->empty()) {
                return FabricError{ErrorCategory::Input, "--reasoner-command must not be empty", "missing_value"};
            }
            req.reasoner_command = raw.reasoner_command.value();
        }
        if (raw.script) {
            std::filesystem::path script_path(raw.script.value());
            const bool exists = std::filesystem::is_regular_file(script_path, path_ec);
            if (path_ec || !exists) {
                return FabricError{ErrorCategory::Input, "Script file does not exist: " + script_path.string(), "invalid_path"};
            }
            req.script_file = std::move(script_path);
        }

        if (raw.max_iterations) {
            auto parsed = parse_uint("--max-iterations", raw.max_iterations.value());
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            if (get_value(parsed) > 10000) {
                return FabricError{ErrorCategory::Input, "--max-iterations out of bounds", "bounds_error", "Must be between 0 and 10000; 0 disables the limit."};
            }
            req.max_iterations = get_value(parsed);
        }

        if (raw.call_timeout_ms) {
            auto parsed = parse_uint("--call-timeout-ms", raw.call_timeout_ms.value());
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            if (get_value(parsed) == 0) {
                return FabricError{ErrorCategory::Input, "--call-timeout-ms out of bounds", "bounds_error", "Must be greater than zero."};
            }
            req.call_timeout_ms = get_value(parsed);
        }

        if (raw.transcript_dir) {
            if (raw.transcript_dir->empty()) {
                return FabricError{ErrorCategory::Input, "--transcript-dir must not be empty", "missing_value"};
            }
            req.transcript_dir = std::filesystem::path(raw.transcript_dir.value());
        }

        return req;
    }

} // namespace fabric::app::cli
