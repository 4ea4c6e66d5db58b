#include <gtest/gtest.h>
#include "session/conversation_manager.hpp"

namespace {

using fabric::core::errors::ErrorCategory;
using fabric::core::errors::get_error;
using fabric::core::errors::get_value;
using fabric::core::errors::is_error;
using fabric::session::ConversationManager;
using fabric::session::ConversationStatus;

TEST(ConversationManagerTest, StartsConversationInRunningState) {
    ConversationManager manager;
    auto started = manager.start_conversation("list files");
    ASSERT_FALSE(is_error(started));

    const auto& id = get_value(started);
    EXPECT_EQ(id.rfind("conv-", 0), 0u);
    EXPECT_EQ(id.size(), 13u);

    auto status = manager.get_status(id);
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status), ConversationStatus::Running);
    EXPECT_EQ(manager.conversation_count(), 1u);
}

TEST(ConversationManagerTest, RejectsEmptyMessage) {
    ConversationManager manager;
    auto started = manager.start_conversation("");
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(started).code, "empty_message");
}

TEST(ConversationManagerTest, CancelSetsTokenAndStatus) {
    ConversationManager manager;
    const auto id = get_value(manager.start_conversation("work"));
    auto token = get_value(manager.get_cancel_token(id));
    EXPECT_FALSE(token->load());

    auto cancelled = manager.cancel(id);
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_EQ(get_value(cancelled), ConversationStatus::Cancelled);
    EXPECT_TRUE(token->load());
}

TEST(ConversationManagerTest, TerminalStatesAreFinal) {
    ConversationManager manager;
    const auto id = get_value(manager.start_conversation("work"));
    ASSERT_FALSE(is_error(manager.mark_completed(id)));

    auto again = manager.mark_failed(id, "late failure");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
    EXPECT_TRUE(is_error(manager.cancel(id)));
}

TEST(ConversationManagerTest, CancelAllSkipsFinishedConversations) {
    ConversationManager manager;
    const auto running = get_value(manager.start_conversation("a"));
    const auto done = get_value(manager.start_conversation("b"));
    ASSERT_FALSE(is_error(manager.mark_completed(done)));

    EXPECT_EQ(manager.cancel_all(), 1u);
    EXPECT_TRUE(get_value(manager.get_cancel_token(running))->load());
    EXPECT_FALSE(get_value(manager.get_cancel_token(done))->load());
}

TEST(ConversationManagerTest, UnknownIdIsReported) {
    ConversationManager manager;
    for (auto result : {manager.get_status("conv-missing"), manager.cancel("conv-missing")}) {
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "conversation_not_found");
    }
    EXPECT_TRUE(is_error(manager.get_cancel_token("conv-missing")));
}

}  // namespace
