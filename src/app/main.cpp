#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/executor_config.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "memory/thread_manager.hpp"
#include "model/scripted_model.hpp"
#include "protocol/json_codec.hpp"
#include "session/agent_session.hpp"
#include "storage/file_message_store.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

std::atomic_bool* g_cancel_flag = nullptr;

extern "C" void handle_interrupt(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

int report(const strand::core::errors::AgentError& err, const std::string& what, int exit_code) {
    STRAND_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        STRAND_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code;
}

int exit_code_for(const strand::protocol::GenerationStatus status) {
    switch (status) {
        case strand::protocol::GenerationStatus::Completed:
            return 0;
        case strand::protocol::GenerationStatus::StepLimitExceeded:
            return 4;
        case strand::protocol::GenerationStatus::Cancelled:
            return 130;
        case strand::protocol::GenerationStatus::Failed:
        default:
            return 1;
    }
}

strand::core::errors::Result<strand::protocol::MemoryThread> open_thread(
    strand::memory::ThreadManager& threads, const strand::app::cli::CliRequest& req) {
    if (req.thread_id) {
        auto existing = threads.get(req.thread_id.value());
        if (!strand::core::errors::is_error(existing) ||
            strand::core::errors::get_error(existing).category !=
                strand::core::errors::ErrorCategory::NotFound) {
            return existing;
        }
    }
    strand::protocol::CreateThreadParams params;
    params.id = req.thread_id;
    params.title = req.message.substr(0, 48);
    return threads.create(params);
}

int run_history(strand::memory::ThreadManager& threads, const strand::app::cli::CliRequest& req) {
    strand::protocol::MessageQuery query;
    query.limit = req.limit;
    query.cursor = req.cursor;
    auto page = threads.get_messages(req.thread_id.value(), query);
    if (strand::core::errors::is_error(page)) {
        return report(strand::core::errors::get_error(page), "History lookup failed", 3);
    }
    const auto& value = strand::core::errors::get_value(page);
    for (const auto& message : value.messages) {
        std::cout << strand::protocol::to_line(strand::protocol::message_to_json(message)) << std::endl;
    }
    if (value.next_cursor) {
        STRAND_LOG_INFO("More messages available: --cursor " + value.next_cursor.value());
    }
    return 0;
}

int run_chat(const std::shared_ptr<strand::memory::ThreadManager>& threads,
             const strand::app::cli::CliRequest& req, const strand::protocol::CancelToken& cancel_token) {
    strand::core::config::ExecutorConfig config;
    if (req.config_file) {
        auto loaded = strand::core::config::load_executor_config(req.config_file.value());
        if (strand::core::errors::is_error(loaded)) {
            return report(strand::core::errors::get_error(loaded), "Config error", 2);
        }
        config = strand::core::errors::get_value(loaded);
    }
    if (req.max_steps) {
        config.max_steps = req.max_steps.value();
    }

    auto model = strand::model::ScriptedModel::from_file(req.script_file);
    if (strand::core::errors::is_error(model)) {
        return report(strand::core::errors::get_error(model), "Model script error", 2);
    }

    strand::tools::ToolRegistry registry;
    strand::tools::BuiltinToolOptions tool_options;
    tool_options.workspace_root = req.workspace;
    tool_options.enable_run_command = req.allow_commands;
    auto registered = strand::tools::register_builtin_tools(registry, tool_options);
    if (strand::core::errors::is_error(registered)) {
        return report(strand::core::errors::get_error(registered), "Tool registration failed", 3);
    }

    auto thread = open_thread(*threads, req);
    if (strand::core::errors::is_error(thread)) {
        return report(strand::core::errors::get_error(thread), "Thread setup failed", 3);
    }
    const std::string thread_id = strand::core::errors::get_value(thread).id;
    strand::core::logging::Logger::get().set_context_id(thread_id);

    auto opened = strand::session::AgentSession::open(
        thread_id, threads, strand::core::errors::get_value(model), registry.snapshot(), config);
    if (strand::core::errors::is_error(opened)) {
        return report(strand::core::errors::get_error(opened), "Session setup failed", 3);
    }
    const auto& session = strand::core::errors::get_value(opened);

    strand::protocol::GenerateOptions options;
    options.cancel_token = cancel_token;

    if (!req.stream) {
        const auto result = session->generate(req.message, options);
        if (!result.ok()) {
            return report(result.error.value(), "Generation " + strand::protocol::to_string(result.status),
                          exit_code_for(result.status));
        }
        STRAND_LOG_INFO("Generation completed in " + std::to_string(result.steps.size()) + " step(s)");
        std::cout << result.text << std::endl;
        return 0;
    }

    // Streaming: one JSON event per line.
    auto stream = session->stream(req.message, options);
    int exit_code = 1;
    while (auto event = stream->next()) {
        std::cout << strand::protocol::to_line(strand::protocol::event_to_json(event.value()))
                  << std::endl;
        if (const auto* done = std::get_if<strand::protocol::GenerationCompleteEvent>(&event.value())) {
            exit_code = exit_code_for(done->result.status);
        } else if (const auto* failed = std::get_if<strand::protocol::ErrorEvent>(&event.value())) {
            exit_code = failed->error.category == strand::core::errors::ErrorCategory::Cancelled ? 130
                        : failed->error.category == strand::core::errors::ErrorCategory::StepLimitExceeded ? 4
                                                                                                           : 1;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    // stdout carries replies and event lines.
    strand::core::logging::Logger::get().set_output(std::cerr);
    strand::core::logging::Logger::get().set_context_id(strand::core::config::generate_id("cli"));

    auto parsed = strand::app::cli::parse_and_validate(argc, argv);
    if (strand::core::errors::is_error(parsed)) {
        return report(strand::core::errors::get_error(parsed), "Input error", 2);
    }
    const auto& req = strand::core::errors::get_value(parsed);
    if (req.verbose) {
        strand::core::logging::Logger::get().set_min_level(strand::core::logging::LogLevel::DEBUG);
    }

    auto store = strand::storage::FileMessageStore::open(req.store_dir);
    if (strand::core::errors::is_error(store)) {
        return report(strand::core::errors::get_error(store), "Failed to open store", 3);
    }
    auto threads = std::make_shared<strand::memory::ThreadManager>(
        strand::core::errors::get_value(store));

    if (req.command == strand::app::cli::CommandKind::History) {
        return run_history(*threads, req);
    }

    // Ctrl-C stops the generation at the next step boundary.
    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    g_cancel_flag = cancel_token.get();
    std::signal(SIGINT, handle_interrupt);
    return run_chat(threads, req, cancel_token);
}
