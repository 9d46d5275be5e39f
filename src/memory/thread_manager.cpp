#include "memory/thread_manager.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"

namespace strand::memory {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::MemoryThread;
using protocol::Message;
using protocol::Role;

ThreadManager::ThreadManager(std::shared_ptr<storage::MessageStore> store)
    : store_(std::move(store)) {}

core::errors::Result<MemoryThread> ThreadManager::create(
    const protocol::CreateThreadParams& params) {
    if (params.id.has_value() && params.id->empty()) {
        return AgentError{ErrorCategory::Validation, "Thread id cannot be empty.",
                          "invalid_thread_id"};
    }

    const std::int64_t now = core::time::now_unix_ms();
    MemoryThread thread;
    thread.id = params.id.value_or(core::config::generate_id("thread"));
    thread.title = params.title.empty() ? "Untitled" : params.title;
    thread.agent_id = params.agent_id;
    thread.resource_id = params.resource_id;
    thread.metadata = params.metadata;
    thread.created_at_ms = now;
    thread.updated_at_ms = now;

    auto created = store_->create_thread(thread);
    if (!core::errors::is_error(created)) {
        STRAND_LOG_INFO("ThreadManager: created thread " + thread.id);
    }
    return created;
}

core::errors::Result<MemoryThread> ThreadManager::get(
    const std::string& thread_id,
    const std::optional<std::string>& resource_id) const {
    auto found = store_->get_thread(thread_id);
    if (core::errors::is_error(found) || !resource_id.has_value()) {
        return found;
    }
    const auto& thread = core::errors::get_value(found);
    if (thread.resource_id != resource_id) {
        return AgentError{ErrorCategory::AccessDenied,
                          "Thread " + thread_id + " is not owned by resource " +
                              resource_id.value(),
                          "thread_access_denied"};
    }
    return found;
}

core::errors::Result<MemoryThread> ThreadManager::check_owner(
    const std::string& thread_id, const std::optional<std::string>& resource_id) const {
    if (!resource_id.has_value()) {
        return MemoryThread{};
    }
    return get(thread_id, resource_id);
}

core::errors::Result<MemoryThread> ThreadManager::update(
    const std::string& thread_id, const protocol::ThreadPatch& patch,
    const std::optional<std::string>& resource_id) {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return owner;
    }
    auto updated = store_->update_thread(thread_id, patch);
    if (!core::errors::is_error(updated)) {
        STRAND_LOG_DEBUG("ThreadManager: updated thread " + thread_id + " (" +
                         std::to_string(patch.metadata.size()) + " keys merged, " +
                         std::to_string(patch.remove_keys.size()) + " removed)");
    }
    return updated;
}

core::errors::Result<std::size_t> ThreadManager::remove(
    const std::string& thread_id, const std::optional<std::string>& resource_id) {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    auto removed = store_->delete_thread(thread_id);
    if (!core::errors::is_error(removed)) {
        STRAND_LOG_INFO("ThreadManager: deleted thread " + thread_id + " and " +
                        std::to_string(core::errors::get_value(removed)) +
                        " messages");
    }
    return removed;
}

core::errors::Result<std::vector<MemoryThread>> ThreadManager::list_threads(
    const protocol::ThreadQuery& query) const {
    auto all = store_->list_threads();
    if (core::errors::is_error(all)) {
        return all;
    }

    std::vector<MemoryThread> out;
    for (const auto& thread : core::errors::get_value(all)) {
        if (query.agent_id.has_value() && thread.agent_id != query.agent_id) {
            continue;
        }
        if (query.resource_id.has_value() && thread.resource_id != query.resource_id) {
            continue;
        }
        out.push_back(thread);
    }
    std::sort(out.begin(), out.end(), [](const MemoryThread& a, const MemoryThread& b) {
        if (a.created_at_ms != b.created_at_ms) {
            return a.created_at_ms < b.created_at_ms;
        }
        return a.id < b.id;
    });
    return out;
}

core::errors::Result<Message> ThreadManager::validate_message(const Message& message) {
    switch (message.role) {
        case Role::Tool:
            if (!message.tool_call_id.has_value() || message.tool_call_id->empty()) {
                return AgentError{ErrorCategory::Validation,
                                  "Tool messages must reference a tool call id.",
                                  "missing_tool_call_id"};
            }
            break;
        case Role::Assistant:
            if (message.content.empty() && message.tool_calls.empty()) {
                return AgentError{ErrorCategory::Validation,
                                  "Assistant messages need content or tool calls.",
                                  "empty_message"};
            }
            break;
        default:
            if (message.content.empty()) {
                return AgentError{ErrorCategory::Validation,
                                  "Message content cannot be empty.",
                                  "empty_message"};
            }
            break;
    }
    return message;
}

core::errors::Result<Message> ThreadManager::add_message(
    const std::string& thread_id, const Message& message,
    const std::optional<std::string>& resource_id) {
    auto valid = validate_message(message);
    if (core::errors::is_error(valid)) {
        return valid;
    }
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    return store_->append(thread_id, message);
}

core::errors::Result<std::vector<Message>> ThreadManager::add_messages(
    const std::string& thread_id, const std::vector<Message>& messages,
    const std::optional<std::string>& resource_id) {
    for (const auto& message : messages) {
        auto valid = validate_message(message);
        if (core::errors::is_error(valid)) {
            return core::errors::get_error(valid);
        }
    }
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    return store_->append_batch(thread_id, messages);
}

core::errors::Result<protocol::MessagePage> ThreadManager::get_messages(
    const std::string& thread_id, const protocol::MessageQuery& query,
    const std::optional<std::string>& resource_id) const {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    return store_->list(thread_id, query);
}

core::errors::Result<std::vector<Message>> ThreadManager::get_history(
    const std::string& thread_id, const std::size_t tail,
    const std::optional<std::string>& resource_id) const {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    protocol::MessageQuery query;
    query.limit = 256;

    std::vector<Message> history;
    while (true) {
        auto page = store_->list(thread_id, query);
        if (core::errors::is_error(page)) {
            return core::errors::get_error(page);
        }
        auto& value = std::get<protocol::MessagePage>(page);
        history.insert(history.end(), std::make_move_iterator(value.messages.begin()),
                       std::make_move_iterator(value.messages.end()));
        if (!value.next_cursor.has_value()) {
            break;
        }
        query.cursor = value.next_cursor;
    }

    if (tail > 0 && history.size() > tail) {
        history.erase(history.begin(),
                      history.begin() + static_cast<std::ptrdiff_t>(history.size() - tail));
    }
    return history;
}

core::errors::Result<std::size_t> ThreadManager::delete_messages(
    const std::string& thread_id, const std::vector<std::string>& message_ids,
    const std::optional<std::string>& resource_id) {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    return store_->delete_messages(thread_id, message_ids);
}

core::errors::Result<protocol::ThreadStats> ThreadManager::stats(
    const std::string& thread_id, const std::optional<std::string>& resource_id) const {
    auto owner = check_owner(thread_id, resource_id);
    if (core::errors::is_error(owner)) {
        return core::errors::get_error(owner);
    }
    return store_->stats(thread_id);
}

core::errors::Result<std::vector<Message>> ThreadManager::search_messages(
    const protocol::MessageQuery& query, const protocol::ThreadQuery& scope) const {
    if (query.limit == 0) {
        return AgentError{ErrorCategory::Validation,
                          "Message query limit must be greater than zero.",
                          "invalid_limit"};
    }
    auto threads = list_threads(scope);
    if (core::errors::is_error(threads)) {
        return core::errors::get_error(threads);
    }

    std::vector<Message> found;
    for (const auto& thread : core::errors::get_value(threads)) {
        if (found.size() == query.limit) {
            break;
        }
        protocol::MessageQuery per_thread = query;
        per_thread.cursor.reset();
        per_thread.reverse = false;
        per_thread.limit = query.limit - found.size();

        auto page = store_->list(thread.id, per_thread);
        if (core::errors::is_error(page)) {
            // Removed after the listing above.
            if (core::errors::get_error(page).category == ErrorCategory::NotFound) {
                continue;
            }
            return core::errors::get_error(page);
        }
        auto& matches = std::get<protocol::MessagePage>(page).messages;
        found.insert(found.end(), std::make_move_iterator(matches.begin()),
                     std::make_move_iterator(matches.end()));
    }
    return found;
}

}  // namespace strand::memory
