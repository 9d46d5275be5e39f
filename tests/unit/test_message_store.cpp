#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/thread_contract.hpp"
#include "storage/in_memory_message_store.hpp"

namespace {

using strand::core::errors::ErrorCategory;
using strand::core::errors::get_error;
using strand::core::errors::get_value;
using strand::core::errors::is_error;
using strand::protocol::make_message;
using strand::protocol::MemoryThread;
using strand::protocol::Message;
using strand::protocol::MessageQuery;
using strand::protocol::Role;
using strand::storage::InMemoryMessageStore;

MemoryThread make_thread(const std::string& id) {
    MemoryThread thread;
    thread.id = id;
    thread.title = "test";
    thread.created_at_ms = 1000;
    thread.updated_at_ms = 1000;
    return thread;
}

class InMemoryMessageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(is_error(store_.create_thread(make_thread("t1"))));
    }

    void append_text(Role role, const std::string& content) {
        ASSERT_FALSE(is_error(store_.append("t1", make_message(role, content))));
    }

    InMemoryMessageStore store_;
};

TEST_F(InMemoryMessageStoreTest, RejectsDuplicateThread) {
    auto again = store_.create_thread(make_thread("t1"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "thread_exists");
}

TEST_F(InMemoryMessageStoreTest, UnknownThreadIsNotFound) {
    auto result = store_.append("missing", make_message(Role::User, "hi"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(result).code, "thread_not_found");
}

TEST_F(InMemoryMessageStoreTest, AssignsIdsAndIncreasingSequences) {
    auto first = store_.append("t1", make_message(Role::User, "one"));
    auto second = store_.append("t1", make_message(Role::Assistant, "two"));
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));

    EXPECT_FALSE(get_value(first).id.empty());
    EXPECT_NE(get_value(first).id, get_value(second).id);
    EXPECT_EQ(get_value(first).thread_id, "t1");
    EXPECT_LT(get_value(first).sequence, get_value(second).sequence);
    EXPECT_GT(get_value(first).created_at_ms, 0);
}

TEST_F(InMemoryMessageStoreTest, AppendIsIdempotentOnClientId) {
    Message message = make_message(Role::User, "hello");
    message.id = "client-1";

    auto first = store_.append("t1", message);
    auto second = store_.append("t1", message);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first).sequence, get_value(second).sequence);

    auto page = store_.list("t1", MessageQuery{});
    ASSERT_FALSE(is_error(page));
    EXPECT_EQ(get_value(page).messages.size(), 1u);
}

TEST_F(InMemoryMessageStoreTest, BatchKeepsOrderAndContiguousSequences) {
    std::vector<Message> batch = {make_message(Role::User, "a"),
                                  make_message(Role::Assistant, "b"),
                                  make_message(Role::User, "c")};
    auto stored = store_.append_batch("t1", batch);
    ASSERT_FALSE(is_error(stored));
    const auto& messages = get_value(stored);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].content, "a");
    EXPECT_EQ(messages[1].sequence, messages[0].sequence + 1);
    EXPECT_EQ(messages[2].sequence, messages[1].sequence + 1);
}

TEST_F(InMemoryMessageStoreTest, PaginatesWithCursor) {
    for (int i = 0; i < 5; ++i) {
        append_text(Role::User, "m" + std::to_string(i));
    }

    MessageQuery query;
    query.limit = 2;
    std::vector<std::string> seen;
    for (int guard = 0; guard < 10; ++guard) {
        auto page = store_.list("t1", query);
        ASSERT_FALSE(is_error(page));
        for (const auto& message : get_value(page).messages) {
            seen.push_back(message.content);
        }
        if (!get_value(page).next_cursor.has_value()) {
            break;
        }
        query.cursor = get_value(page).next_cursor;
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"m0", "m1", "m2", "m3", "m4"}));
}

TEST_F(InMemoryMessageStoreTest, LastPageHasNoCursor) {
    append_text(Role::User, "only");
    MessageQuery query;
    query.limit = 1;
    auto page = store_.list("t1", query);
    ASSERT_FALSE(is_error(page));
    EXPECT_EQ(get_value(page).messages.size(), 1u);
    EXPECT_FALSE(get_value(page).next_cursor.has_value());
}

TEST_F(InMemoryMessageStoreTest, ReverseReturnsNewestFirst) {
    append_text(Role::User, "first");
    append_text(Role::Assistant, "second");
    append_text(Role::User, "third");

    MessageQuery query;
    query.reverse = true;
    query.limit = 2;
    auto page = store_.list("t1", query);
    ASSERT_FALSE(is_error(page));
    ASSERT_EQ(get_value(page).messages.size(), 2u);
    EXPECT_EQ(get_value(page).messages[0].content, "third");
    EXPECT_EQ(get_value(page).messages[1].content, "second");

    query.cursor = get_value(page).next_cursor;
    auto rest = store_.list("t1", query);
    ASSERT_FALSE(is_error(rest));
    ASSERT_EQ(get_value(rest).messages.size(), 1u);
    EXPECT_EQ(get_value(rest).messages[0].content, "first");
}

TEST_F(InMemoryMessageStoreTest, FiltersByRoleAndKeywords) {
    append_text(Role::User, "What is the Weather in Paris?");
    append_text(Role::Assistant, "The weather in Paris is sunny.");
    append_text(Role::User, "And in Rome?");

    MessageQuery by_role;
    by_role.role = Role::User;
    auto users = store_.list("t1", by_role);
    ASSERT_FALSE(is_error(users));
    EXPECT_EQ(get_value(users).messages.size(), 2u);

    MessageQuery by_keyword;
    by_keyword.keywords = {"weather", "PARIS"};
    auto matches = store_.list("t1", by_keyword);
    ASSERT_FALSE(is_error(matches));
    EXPECT_EQ(get_value(matches).messages.size(), 2u);

    by_keyword.role = Role::Assistant;
    auto assistant = store_.list("t1", by_keyword);
    ASSERT_FALSE(is_error(assistant));
    ASSERT_EQ(get_value(assistant).messages.size(), 1u);
    EXPECT_EQ(get_value(assistant).messages[0].role, Role::Assistant);
}

TEST_F(InMemoryMessageStoreTest, RejectsBadCursorAndLimit) {
    MessageQuery bad_cursor;
    bad_cursor.cursor = "abc";
    auto cursor = store_.list("t1", bad_cursor);
    ASSERT_TRUE(is_error(cursor));
    EXPECT_EQ(get_error(cursor).code, "invalid_cursor");

    MessageQuery zero;
    zero.limit = 0;
    auto limit = store_.list("t1", zero);
    ASSERT_TRUE(is_error(limit));
    EXPECT_EQ(get_error(limit).code, "invalid_limit");
}

TEST_F(InMemoryMessageStoreTest, DeletesSelectedMessages) {
    auto keep = store_.append("t1", make_message(Role::User, "keep"));
    auto drop = store_.append("t1", make_message(Role::User, "drop"));
    ASSERT_FALSE(is_error(keep));
    ASSERT_FALSE(is_error(drop));

    auto removed = store_.delete_messages("t1", {get_value(drop).id, "unknown-id"});
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(get_value(removed), 1u);

    auto page = store_.list("t1", MessageQuery{});
    ASSERT_FALSE(is_error(page));
    ASSERT_EQ(get_value(page).messages.size(), 1u);
    EXPECT_EQ(get_value(page).messages[0].content, "keep");

    // Sequences are never reused after a delete.
    auto next = store_.append("t1", make_message(Role::User, "next"));
    ASSERT_FALSE(is_error(next));
    EXPECT_GT(get_value(next).sequence, get_value(drop).sequence);
}

TEST_F(InMemoryMessageStoreTest, ReportsStats) {
    append_text(Role::User, "hello");
    append_text(Role::Assistant, "hi there");

    auto stats = store_.stats("t1");
    ASSERT_FALSE(is_error(stats));
    const auto& value = get_value(stats);
    EXPECT_EQ(value.message_count, 2u);
    EXPECT_EQ(value.user_message_count, 1u);
    EXPECT_EQ(value.assistant_message_count, 1u);
    EXPECT_EQ(value.tool_message_count, 0u);
    EXPECT_EQ(value.size_bytes, 13u);
    EXPECT_EQ(value.created_at_ms, 1000);
    EXPECT_TRUE(value.last_message_at_ms.has_value());
}

TEST_F(InMemoryMessageStoreTest, DeleteThreadRemovesMessages) {
    append_text(Role::User, "bye");
    auto removed = store_.delete_thread("t1");
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(get_value(removed), 1u);

    auto gone = store_.get_thread("t1");
    ASSERT_TRUE(is_error(gone));
    EXPECT_EQ(get_error(gone).category, ErrorCategory::NotFound);
}

}  // namespace
