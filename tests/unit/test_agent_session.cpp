#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/executor_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "memory/thread_manager.hpp"
#include "model/scripted_model.hpp"
#include "protocol/event_contract.hpp"
#include "session/agent_session.hpp"
#include "storage/in_memory_message_store.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using strand::core::config::ExecutorConfig;
using strand::core::errors::ErrorCategory;
using strand::core::errors::get_error;
using strand::core::errors::get_value;
using strand::core::errors::is_error;
using strand::memory::ThreadManager;
using strand::model::ScriptedModel;
using strand::model::ScriptedReply;
using strand::protocol::AgentEvent;
using strand::protocol::CreateThreadParams;
using strand::protocol::ErrorEvent;
using strand::protocol::GenerateOptions;
using strand::protocol::GenerationCompleteEvent;
using strand::protocol::GenerationStatus;
using strand::protocol::TextDeltaEvent;
using strand::protocol::ToolCall;
using strand::session::AgentSession;
using strand::storage::InMemoryMessageStore;
using strand::tools::ToolRegistry;
using nlohmann::json;

ToolCall add_call(const std::string& id, int a, int b) {
    ToolCall call;
    call.id = id;
    call.tool_name = "calculator";
    call.arguments = json{{"op", "add"}, {"a", a}, {"b", b}};
    return call;
}

class AgentSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        threads_ = std::make_shared<ThreadManager>(std::make_shared<InMemoryMessageStore>());
        auto created = threads_->create(CreateThreadParams{});
        ASSERT_FALSE(is_error(created));
        thread_id_ = get_value(created).id;

        ToolRegistry registry;
        strand::tools::BuiltinToolOptions options;
        options.enable_read_file = false;
        ASSERT_FALSE(is_error(strand::tools::register_builtin_tools(registry, options)));
        registry_ = registry.snapshot();

        config_.retry.initial_backoff_ms = 1;
        config_.retry.max_backoff_ms = 4;
    }

    std::shared_ptr<AgentSession> open_session(const ExecutorConfig& config) {
        auto session = AgentSession::open(thread_id_, threads_, model_, registry_, config);
        EXPECT_FALSE(is_error(session));
        return is_error(session) ? nullptr : get_value(session);
    }

    void script_calculator_round_trip() {
        model_->push(ScriptedReply::make_tool_calls({add_call("call-1", 2, 2)}));
        model_->push(ScriptedReply::make_text("2 + 2 = 4"));
    }

    std::shared_ptr<ThreadManager> threads_;
    std::shared_ptr<ScriptedModel> model_ = std::make_shared<ScriptedModel>();
    std::shared_ptr<const ToolRegistry> registry_;
    std::string thread_id_;
    ExecutorConfig config_;
};

TEST_F(AgentSessionTest, OpenRejectsUnknownThread) {
    auto session = AgentSession::open("thread-missing", threads_, model_, registry_, config_);
    ASSERT_TRUE(is_error(session));
    EXPECT_EQ(get_error(session).category, ErrorCategory::NotFound);
}

TEST_F(AgentSessionTest, OpenRejectsInvalidConfig) {
    ExecutorConfig config = config_;
    config.max_steps = 0;
    auto session = AgentSession::open(thread_id_, threads_, model_, registry_, config);
    ASSERT_TRUE(is_error(session));
    EXPECT_EQ(get_error(session).category, ErrorCategory::Validation);
}

TEST_F(AgentSessionTest, OpenRejectsMissingCollaborators) {
    auto session = AgentSession::open(thread_id_, threads_, nullptr, registry_, config_);
    ASSERT_TRUE(is_error(session));
    EXPECT_EQ(get_error(session).code, "invalid_session");
}

TEST_F(AgentSessionTest, GenerateRunsToCompletion) {
    script_calculator_round_trip();
    auto session = open_session(config_);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->thread_id(), thread_id_);

    const auto result = session->generate("What is 2+2?");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.text, "2 + 2 = 4");
    EXPECT_EQ(result.steps.size(), 2u);

    auto history = threads_->get_history(thread_id_);
    ASSERT_FALSE(is_error(history));
    EXPECT_EQ(get_value(history).size(), 4u);
}

TEST_F(AgentSessionTest, StreamDeliversEventsUpToTerminal) {
    script_calculator_round_trip();
    auto session = open_session(config_);
    ASSERT_NE(session, nullptr);

    auto stream = session->stream("What is 2+2?");
    std::vector<AgentEvent> events;
    while (auto event = stream->next()) {
        events.push_back(std::move(event.value()));
    }
    EXPECT_TRUE(stream->finished());
    EXPECT_FALSE(stream->next().has_value());

    ASSERT_FALSE(events.empty());
    const auto* complete = std::get_if<GenerationCompleteEvent>(&events.back());
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->result.text, "2 + 2 = 4");

    std::string streamed_text;
    std::size_t terminal_count = 0;
    for (const auto& event : events) {
        if (const auto* delta = std::get_if<TextDeltaEvent>(&event)) {
            streamed_text += delta->delta;
        }
        if (strand::protocol::is_terminal(event)) {
            ++terminal_count;
        }
    }
    EXPECT_EQ(streamed_text, "2 + 2 = 4");
    EXPECT_EQ(terminal_count, 1u);
}

TEST_F(AgentSessionTest, StreamAndGenerateAgree) {
    script_calculator_round_trip();
    script_calculator_round_trip();
    auto session = open_session(config_);
    ASSERT_NE(session, nullptr);

    const auto batch = session->generate("What is 2+2?");
    auto stream = session->stream("What is 2+2?");
    std::optional<AgentEvent> last;
    while (auto event = stream->next()) {
        last = std::move(event);
    }
    ASSERT_TRUE(last.has_value());
    const auto* complete = std::get_if<GenerationCompleteEvent>(&last.value());
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->result.text, batch.text);
    EXPECT_EQ(complete->result.steps.size(), batch.steps.size());
}

TEST_F(AgentSessionTest, StreamReportsFailureAsErrorEvent) {
    model_->push(ScriptedReply::make_fatal_error("bad credentials"));
    auto session = open_session(config_);
    ASSERT_NE(session, nullptr);

    auto stream = session->stream("hi");
    auto event = stream->next();
    ASSERT_TRUE(event.has_value());
    const auto* failure = std::get_if<ErrorEvent>(&event.value());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->error.category, ErrorCategory::Provider);
    EXPECT_FALSE(stream->next().has_value());
}

TEST_F(AgentSessionTest, DroppingStreamCancelsGeneration) {
    ExecutorConfig config = config_;
    config.retry.initial_backoff_ms = 5000;
    config.retry.max_backoff_ms = 5000;
    model_->push(ScriptedReply::make_transient_error("busy"));
    model_->push(ScriptedReply::make_text("unreached"));
    auto session = open_session(config);
    ASSERT_NE(session, nullptr);

    GenerateOptions options;
    options.cancel_token = std::make_shared<std::atomic_bool>(false);
    const auto started = std::chrono::steady_clock::now();
    {
        auto stream = session->stream("hi", options);
        EXPECT_FALSE(stream->finished());
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(options.cancel_token->load());
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    EXPECT_GE(model_->remaining(), 1u);
}

TEST_F(AgentSessionTest, SmallBufferStillDeliversEveryEvent) {
    ExecutorConfig config = config_;
    config.event_buffer_capacity = 1;
    config.text_chunk_size = 1;
    model_->push(ScriptedReply::make_text("abcdefgh"));
    auto session = open_session(config);
    ASSERT_NE(session, nullptr);

    auto stream = session->stream("spell it");
    std::size_t deltas = 0;
    while (auto event = stream->next()) {
        if (std::holds_alternative<TextDeltaEvent>(event.value())) {
            ++deltas;
        }
    }
    EXPECT_EQ(deltas, 8u);
}

TEST_F(AgentSessionTest, CancelledStreamEndsWithCancelledError) {
    auto session = open_session(config_);
    ASSERT_NE(session, nullptr);

    GenerateOptions options;
    options.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto stream = session->stream("hi", options);
    auto event = stream->next();
    ASSERT_TRUE(event.has_value());
    const auto* failure = std::get_if<ErrorEvent>(&event.value());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->error.category, ErrorCategory::Cancelled);
    EXPECT_EQ(model_->call_count(), 0u);

    const auto batch = session->generate("hi", options);
    EXPECT_EQ(batch.status, GenerationStatus::Cancelled);
}

}  // namespace
