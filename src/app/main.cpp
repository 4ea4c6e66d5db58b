#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "conversation/conversation_controller.hpp"
#include "conversation/process_reasoner.hpp"
#include "conversation/scripted_reasoner.hpp"
#include "core/config/fabric_config.hpp"
#include "core/errors/fabric_errors.hpp"
#include "core/logging/logger.hpp"
#include "mesh/dispatcher.hpp"
#include "mesh/server_pool.hpp"
#include "session/conversation_manager.hpp"
#include "session/transcript_writer.hpp"

namespace {

namespace errors = fabric::core::errors;

constexpr int kExitDone = 0;
constexpr int kExitFailed = 1;
constexpr int kExitInput = 2;
constexpr int kExitStartup = 3;
constexpr int kExitIterationLimit = 4;
constexpr int kExitCancelled = 5;
constexpr int kExitTranscript = 6;

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

void report(const std::string& what, const errors::FabricError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const fabric::conversation::ConversationOutcome& outcome) {
    if (outcome.phase == fabric::conversation::ConversationPhase::Done) {
        return kExitDone;
    }
    if (outcome.error && outcome.error->category == errors::ErrorCategory::IterationLimit) {
        return kExitIterationLimit;
    }
    if (outcome.error && outcome.error->category == errors::ErrorCategory::Cancelled) {
        return kExitCancelled;
    }
    return kExitFailed;
}

// Polls the SIGINT flag and turns it into cooperative cancellation.
class InterruptWatcher {
public:
    explicit InterruptWatcher(fabric::session::ConversationManager& manager)
        : manager_(manager), thread_([this]() { watch(); }) {}

    ~InterruptWatcher() {
        stop_ = true;
        thread_.join();
    }

private:
    void watch() {
        while (!stop_) {
            if (g_interrupted != 0) {
                g_interrupted = 0;
                LOG_WARN("Interrupt received; cancelling " +
                         std::to_string(manager_.cancel_all()) + " conversation(s)");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    fabric::session::ConversationManager& manager_;
    std::atomic_bool stop_{false};
    std::thread thread_;
};

int list_tools(fabric::mesh::ServerPool& pool) {
    auto registry = pool.snapshot();
    for (const auto& descriptor : registry->describe_all()) {
        std::cout << descriptor.qualified_name;
        if (!descriptor.description.empty()) {
            std::cout << "\t" << descriptor.description;
        }
        std::cout << "\n";
    }
    std::cout.flush();
    LOG_INFO("Catalog: " + std::to_string(registry->size()) + " tools from " +
             std::to_string(registry->server_ids().size()) + " servers");
    return kExitDone;
}

int run_conversation(const fabric::protocol::ConversationRequest& req,
                     const fabric::core::config::FabricConfig& config,
                     fabric::mesh::ServerPool& pool) {
    std::unique_ptr<fabric::conversation::Reasoner> reasoner;
    if (req.script_file) {
        auto scripted = fabric::conversation::ScriptedReasoner::from_file(req.script_file.value());
        if (errors::is_error(scripted)) {
            report("Failed to load reasoner script", errors::get_error(scripted));
            return kExitInput;
        }
        reasoner = std::move(errors::get_value(scripted));
    } else {
        fabric::conversation::ProcessReasonerOptions options;
        options.command = req.reasoner_command.value();
        options.working_directory = std::filesystem::current_path();
        reasoner = std::make_unique<fabric::conversation::ProcessReasoner>(std::move(options));
    }

    fabric::mesh::DispatcherOptions dispatch_options;
    dispatch_options.call_timeout =
        std::chrono::milliseconds(req.call_timeout_ms.value_or(config.limits.call_timeout_ms));
    dispatch_options.max_in_flight = config.limits.max_in_flight;
    fabric::mesh::Dispatcher dispatcher(dispatch_options);

    fabric::conversation::ControllerOptions controller_options;
    const std::uint32_t max_iterations =
        req.max_iterations.value_or(config.limits.max_iterations);
    if (max_iterations > 0) {
        controller_options.max_iterations = max_iterations;
    }

    fabric::session::ConversationManager manager;
    auto started = manager.start_conversation(req.message);
    if (errors::is_error(started)) {
        report("Failed to start conversation", errors::get_error(started));
        return kExitStartup;
    }
    const std::string conversation_id = errors::get_value(started);
    fabric::core::logging::Logger::get().set_context_id(conversation_id);

    auto token_result = manager.get_cancel_token(conversation_id);
    if (errors::is_error(token_result)) {
        report("Failed to get cancellation token", errors::get_error(token_result));
        return kExitStartup;
    }
    auto cancel_token = errors::get_value(token_result);

    std::optional<fabric::session::TranscriptWriter> transcript;
    if (req.transcript_dir) {
        transcript.emplace(req.transcript_dir.value());
        auto written = transcript->write_request(conversation_id, req.message,
                                                 pool.snapshot()->size());
        if (errors::is_error(written)) {
            report("Failed to write transcript", errors::get_error(written));
            return kExitTranscript;
        }
    }

    fabric::conversation::ConversationController controller(
        *reasoner, [&pool]() { return pool.snapshot(); }, dispatcher, controller_options);

    std::optional<errors::FabricError> transcript_error;
    controller.set_observer([&](const fabric::protocol::Message& message) {
        if (message.role == fabric::protocol::Role::ToolResult && message.result) {
            const auto& result = message.result.value();
            LOG_INFO("Tool " + result.tool_name + " (" + result.call_id + "): " +
                     (result.success ? "ok" : "failed") + " in " +
                     std::to_string(result.duration_ms) + "ms");
        }
        if (!transcript || transcript_error) {
            return;
        }
        auto written = transcript->write_message(conversation_id, message);
        if (errors::is_error(written)) {
            transcript_error = errors::get_error(written);
        }
    });

    std::signal(SIGINT, on_sigint);
    fabric::conversation::ConversationOutcome outcome;
    {
        InterruptWatcher watcher(manager);
        outcome = controller.run(req.message, cancel_token);
    }
    std::signal(SIGINT, SIG_DFL);

    const int code = exit_code_for(outcome);
    if (code == kExitDone) {
        static_cast<void>(manager.mark_completed(conversation_id));
        std::cout << outcome.final_text.value_or("") << std::endl;
    } else if (code == kExitCancelled) {
        static_cast<void>(manager.cancel(conversation_id));
        report("Conversation cancelled", outcome.error.value());
    } else {
        const auto& err = outcome.error.value();
        static_cast<void>(manager.mark_failed(conversation_id, err.message));
        report("Conversation failed", err);
    }

    auto status = manager.get_status(conversation_id);
    if (!errors::is_error(status)) {
        LOG_INFO("Final conversation status: " +
                 fabric::session::to_string(errors::get_value(status)) + " after " +
                 std::to_string(outcome.cycles) + " tool cycle(s)");
    }

    if (transcript) {
        if (!transcript_error) {
            auto written = transcript->write_final(
                conversation_id, fabric::conversation::to_string(outcome.phase),
                outcome.final_text.value_or(""), outcome.error);
            if (errors::is_error(written)) {
                transcript_error = errors::get_error(written);
            } else {
                LOG_INFO("Transcript: " + errors::get_value(written).string());
            }
        }
        if (transcript_error) {
            report("Failed to write transcript", transcript_error.value());
            return kExitTranscript;
        }
    }
    return code;
}

}  // namespace

int main(int argc, char* argv[]) {
    LOG_INFO("toolfabric: bootstrapping");
    auto parsed = fabric::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report("Input error", errors::get_error(parsed));
        return kExitInput;
    }
    const auto& req = errors::get_value(parsed);
    if (req.verbose) {
        fabric::core::logging::Logger::get().set_min_level(fabric::core::logging::LogLevel::DEBUG);
    }

    auto loaded = fabric::core::config::load_config(req.config_file);
    if (errors::is_error(loaded)) {
        report("Invalid configuration", errors::get_error(loaded));
        return kExitInput;
    }
    auto config = errors::get_value(loaded);
    if (req.call_timeout_ms) {
        fabric::core::config::Limits overridden = config.limits;
        overridden.call_timeout_ms = req.call_timeout_ms.value();
        auto validated = fabric::core::config::validate_limits(overridden);
        if (errors::is_error(validated)) {
            report("Invalid limits", errors::get_error(validated));
            return kExitInput;
        }
        config.limits = overridden;
    }

    fabric::mesh::ConnectionOptions connection_options;
    connection_options.handshake_timeout =
        std::chrono::milliseconds(config.limits.handshake_timeout_ms);
    connection_options.shutdown_grace = std::chrono::milliseconds(config.limits.shutdown_grace_ms);
    fabric::mesh::ServerPool pool(connection_options);

    // Unreachable servers only shrink the catalog; a pool with no live server
    // when servers were configured is a startup failure.
    const auto failures = pool.add_servers(config.servers);
    if (!config.servers.empty() && failures.size() == config.servers.size()) {
        LOG_ERROR("No configured server could be started");
        return kExitStartup;
    }

    const int code = req.command == fabric::protocol::Command::ListTools
                         ? list_tools(pool)
                         : run_conversation(req, config, pool);
    pool.shutdown();
    return code;
}
