#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/fabric_errors.hpp"
#include "support/test_support.hpp"

namespace {

using fabric::app::cli::parse_and_validate;
using fabric::core::errors::ErrorCategory;
using fabric::core::errors::get_error;
using fabric::core::errors::get_value;
using fabric::core::errors::is_error;
using fabric::protocol::Command;
using fabric::protocol::ConversationRequest;
using fabric::testing::TempWorkspace;

fabric::core::errors::Result<ConversationRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("toolfabric");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = (workspace_.root() / "fabric.json").string();
        script_ = (workspace_.root() / "script.json").string();
        std::ofstream(config_) << R"({"servers": {}})";
        std::ofstream(script_) << R"([{"text": "hi"}])";
    }

    std::vector<std::string> run_args(std::vector<std::string> extra) const {
        std::vector<std::string> args = {"run", "--config", config_, "--message", "hello"};
        args.insert(args.end(), extra.begin(), extra.end());
        return args;
    }

    TempWorkspace workspace_{"cli"};
    std::string config_;
    std::string script_;
};

TEST_F(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST_F(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST_F(CliParserTest, FailsWhenConfigMissing) {
    auto result = parse_tokens({"tools"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST_F(CliParserTest, FailsWhenConfigFileDoesNotExist) {
    auto result = parse_tokens(
        {"tools", "--config", (workspace_.root() / "absent.json").string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST_F(CliParserTest, ParsesToolsCommand) {
    auto result = parse_tokens({"tools", "--config", config_, "--verbose"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::ListTools);
    EXPECT_TRUE(get_value(result).verbose);
}

TEST_F(CliParserTest, ToolsRejectsRunFlags) {
    auto result = parse_tokens({"tools", "--config", config_, "--message", "hi"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_flag");
}

TEST_F(CliParserTest, FailsWhenMessageMissing) {
    auto result = parse_tokens({"run", "--config", config_, "--script", script_});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST_F(CliParserTest, FailsWhenNoReasonerGiven) {
    auto result = parse_tokens(run_args({}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST_F(CliParserTest, FailsWhenBothReasonersGiven) {
    auto result = parse_tokens(run_args({"--script", script_, "--reasoner-command", "cat"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST_F(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens(run_args({"--script"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST_F(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens(run_args({"--script", script_, "--fast"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST_F(CliParserTest, FailsWhenMaxIterationsNotNumeric) {
    auto result = parse_tokens(run_args({"--script", script_, "--max-iterations", "12abc"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST_F(CliParserTest, FailsWhenCallTimeoutIsZero) {
    auto result = parse_tokens(run_args({"--script", script_, "--call-timeout-ms", "0"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST_F(CliParserTest, ParsesFullRunRequest) {
    auto result = parse_tokens(run_args({"--script", script_, "--max-iterations", "0",
                                         "--call-timeout-ms", "1500", "--transcript-dir",
                                         "out"}));
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::Run);
    EXPECT_EQ(req.message, "hello");
    EXPECT_EQ(req.script_file.value(), std::filesystem::path(script_));
    EXPECT_FALSE(req.reasoner_command.has_value());
    EXPECT_EQ(req.max_iterations.value(), 0u);
    EXPECT_EQ(req.call_timeout_ms.value(), 1500u);
    EXPECT_EQ(req.transcript_dir.value(), std::filesystem::path("out"));
    EXPECT_FALSE(req.verbose);
}

TEST_F(CliParserTest, ParsesReasonerCommand) {
    auto result = parse_tokens(run_args({"--reasoner-command", "python3 reasoner.py"}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reasoner_command.value(), "python3 reasoner.py");
    EXPECT_FALSE(get_value(result).max_iterations.has_value());
}

}  // namespace
