#include "storage/message_store.hpp"

namespace strand::storage {

using core::errors::AgentError;
using core::errors::ErrorCategory;

AgentError thread_not_found(const std::string& thread_id) {
    return AgentError{ErrorCategory::NotFound, "Thread not found: " + thread_id,
                      "thread_not_found"};
}

core::errors::Result<protocol::Message> MessageStore::append(
    const std::string& thread_id, const protocol::Message& message) {
    auto appended = append_batch(thread_id, {message});
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }
    const auto& messages = core::errors::get_value(appended);
    if (messages.size() != 1) {
        return AgentError{ErrorCategory::Internal,
                          "Single append produced " +
                              std::to_string(messages.size()) + " messages.",
                          "append_count_mismatch"};
    }
    return messages.front();
}

}  // namespace strand::storage
