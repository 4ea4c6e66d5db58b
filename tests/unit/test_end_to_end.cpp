#include <chrono>
#include <future>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "conversation/conversation_controller.hpp"
#include "conversation/scripted_reasoner.hpp"
#include "mesh/dispatcher.hpp"
#include "mesh/server_pool.hpp"
#include "support/test_support.hpp"

namespace {

using fabric::conversation::ControllerOptions;
using fabric::conversation::ConversationController;
using fabric::conversation::ConversationPhase;
using fabric::conversation::ScriptedReasoner;
using fabric::core::errors::ErrorCategory;
using fabric::core::errors::Result;
using fabric::mesh::ConnectionOptions;
using fabric::mesh::Dispatcher;
using fabric::mesh::DispatcherOptions;
using fabric::mesh::ServerPool;
using fabric::protocol::Message;
using fabric::protocol::ReasonerOutput;
using fabric::protocol::Role;
using fabric::protocol::ServerSpec;
using fabric::protocol::ToolDescriptor;
using fabric::testing::CallbackReasoner;
using fabric::testing::TempWorkspace;
using fabric::testing::answers;
using fabric::testing::fake_server_spec;
using fabric::testing::make_call;
using fabric::testing::wants;

ConnectionOptions pool_options() {
    ConnectionOptions options;
    options.handshake_timeout = std::chrono::milliseconds(3000);
    options.shutdown_grace = std::chrono::milliseconds(200);
    return options;
}

DispatcherOptions dispatch_options() {
    DispatcherOptions options;
    options.call_timeout = std::chrono::milliseconds(3000);
    options.max_in_flight = 4;
    return options;
}

TEST(EndToEndTest, ListsADirectoryThroughAWorker) {
    TempWorkspace workspace("e2e");
    std::ofstream(workspace.root() / "notes.txt") << "x";
    std::ofstream(workspace.root() / "todo.txt") << "y";

    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("filesystem", {"--tools", "list_dir"}),
                                  fake_server_spec("search", {"--tools", "echo"})})
                    .empty());
    Dispatcher dispatcher(dispatch_options());

    const std::string path = workspace.root().string();
    CallbackReasoner reasoner([&](const std::vector<Message>& history,
                                  const std::vector<ToolDescriptor>&) -> Result<ReasonerOutput> {
        if (history.size() == 1) {
            return wants({make_call("filesystem.list_dir", {{"path", path}})});
        }
        return answers("Files:\n" + history.back().content);
    });
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher);

    auto outcome = controller.run("list files in " + path);
    ASSERT_EQ(outcome.phase, ConversationPhase::Done);
    EXPECT_EQ(outcome.final_text.value(), "Files:\nnotes.txt\ntodo.txt\n");
}

TEST(EndToEndTest, UnreachableWorkerYieldsOneFailedResult) {
    ServerPool pool(pool_options());
    ServerSpec calc;
    calc.id = "calc";
    calc.command = "/definitely/not/a/real/binary";
    auto errors = pool.add_servers({fake_server_spec("search", {"--tools", "echo"}), calc});
    ASSERT_EQ(errors.size(), 1u);
    Dispatcher dispatcher(dispatch_options());

    std::vector<Message> second_turn;
    CallbackReasoner reasoner([&](const std::vector<Message>& history,
                                  const std::vector<ToolDescriptor>&) -> Result<ReasonerOutput> {
        if (history.size() == 1) {
            return wants({make_call("search.echo", {{"text", "sunny"}}),
                          make_call("calc.add", {{"a", 1}, {"b", 2}})});
        }
        second_turn = history;
        return answers("It is " + history[2].content);
    });
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher);

    auto outcome = controller.run("weather and arithmetic");
    ASSERT_EQ(outcome.phase, ConversationPhase::Done);
    EXPECT_EQ(outcome.final_text.value(), "It is sunny");
    ASSERT_EQ(second_turn.size(), 4u);
    EXPECT_TRUE(second_turn[2].result->success);
    EXPECT_FALSE(second_turn[3].result->success);
    EXPECT_EQ(second_turn[3].result->error_category.value(), ErrorCategory::UnknownTool);
}

TEST(EndToEndTest, HungWorkerTimesOutWithoutBlockingSiblings) {
    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("slow", {"--tools", "hang"}),
                                  fake_server_spec("fast", {"--tools", "echo"})})
                    .empty());
    DispatcherOptions options = dispatch_options();
    options.call_timeout = std::chrono::milliseconds(200);
    Dispatcher dispatcher(options);

    ScriptedReasoner reasoner({wants({make_call("hang"), make_call("echo", {{"text", "hi"}})}),
                               wants({make_call("echo", {{"text", "again"}})}), answers("ok")});
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher);

    auto outcome = controller.run("mixed");
    ASSERT_EQ(outcome.phase, ConversationPhase::Done);
    ASSERT_EQ(outcome.history.size(), 7u);
    EXPECT_EQ(outcome.history[2].result->error_category.value(), ErrorCategory::Timeout);
    EXPECT_EQ(outcome.history[3].content, "hi");
    EXPECT_EQ(outcome.history[5].content, "again");
}

TEST(EndToEndTest, CrashedWorkerDoesNotAffectOthers) {
    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("fragile", {"--tools", "crash"}),
                                  fake_server_spec("steady", {"--tools", "echo"})})
                    .empty());
    Dispatcher dispatcher(dispatch_options());

    ScriptedReasoner reasoner({wants({make_call("crash")}),
                               wants({make_call("echo", {{"text", "alive"}})}), answers("ok")});
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher);

    auto outcome = controller.run("crash then echo");
    ASSERT_EQ(outcome.phase, ConversationPhase::Done);
    EXPECT_EQ(outcome.history[2].result->error_category.value(), ErrorCategory::ConnectionLost);
    EXPECT_EQ(outcome.history[4].content, "alive");
    EXPECT_EQ(pool.refresh()->size(), 1u);
}

TEST(EndToEndTest, WrongTypedToolReplyBecomesAFailedResult) {
    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("odd", {"--tools", "bad_text,bad_error"}),
                                  fake_server_spec("steady", {"--tools", "echo"})})
                    .empty());
    Dispatcher dispatcher(dispatch_options());

    ScriptedReasoner reasoner({wants({make_call("bad_text"), make_call("bad_error"),
                                      make_call("echo", {{"text", "fine"}})}),
                               answers("ok")});
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher);

    auto outcome = controller.run("odd replies");
    ASSERT_EQ(outcome.phase, ConversationPhase::Done);
    ASSERT_EQ(outcome.history.size(), 6u);
    EXPECT_EQ(outcome.history[2].result->error_category.value(), ErrorCategory::Protocol);
    EXPECT_FALSE(outcome.history[3].result->success);
    EXPECT_TRUE(outcome.history[4].result->success);
    EXPECT_EQ(outcome.history[4].content, "fine");
    EXPECT_EQ(pool.refresh()->size(), 3u);
}

TEST(EndToEndTest, ConcurrentConversationsShareConnections) {
    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("shared", {"--tools", "sleep,echo"})}).empty());
    Dispatcher dispatcher(dispatch_options());

    auto converse = [&](const std::string& word) {
        ScriptedReasoner reasoner({wants({make_call("sleep", {{"ms", 150}}),
                                          make_call("echo", {{"text", word}})}),
                                   answers(word)});
        ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                          dispatcher);
        return controller.run(word);
    };

    auto first = std::async(std::launch::async, converse, std::string("left"));
    auto second = std::async(std::launch::async, converse, std::string("right"));
    auto left = first.get();
    auto right = second.get();

    ASSERT_EQ(left.phase, ConversationPhase::Done);
    ASSERT_EQ(right.phase, ConversationPhase::Done);
    EXPECT_EQ(left.history[3].content, "left");
    EXPECT_EQ(right.history[3].content, "right");
    EXPECT_EQ(left.history[2].content, "slept 150");
}

TEST(EndToEndTest, IterationLimitAgainstRealWorkers) {
    ServerPool pool(pool_options());
    ASSERT_TRUE(pool.add_servers({fake_server_spec("loop", {"--tools", "echo"})}).empty());
    Dispatcher dispatcher(dispatch_options());

    CallbackReasoner reasoner([](const std::vector<Message>&, const std::vector<ToolDescriptor>&)
                                  -> Result<ReasonerOutput> {
        return wants({make_call("echo", {{"text", "again"}})});
    });
    ControllerOptions options;
    options.max_iterations = 2;
    ConversationController controller(reasoner, [&pool]() { return pool.snapshot(); },
                                      dispatcher, options);

    auto outcome = controller.run("never stop");
    EXPECT_EQ(outcome.phase, ConversationPhase::Failed);
    EXPECT_EQ(outcome.error->category, ErrorCategory::IterationLimit);
    EXPECT_EQ(outcome.cycles, 2u);
}

}  // namespace
