#include "storage/in_memory_message_store.hpp"

#include <algorithm>
#include <utility>
#include "core/time/timestamps.hpp"

namespace strand::storage {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::MemoryThread;
using protocol::Message;

core::errors::Result<MemoryThread> InMemoryMessageStore::create_thread(
    const MemoryThread& thread) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (threads_.find(thread.id) != threads_.end()) {
        return AgentError{ErrorCategory::Validation,
                          "Thread already exists: " + thread.id,
                          "thread_exists"};
    }
    auto [it, inserted] = threads_.emplace(thread.id, ThreadLog(thread));
    static_cast<void>(inserted);
    return it->second.header();
}

core::errors::Result<MemoryThread> InMemoryMessageStore::get_thread(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.header();
}

core::errors::Result<MemoryThread> InMemoryMessageStore::update_thread(
    const std::string& thread_id, const protocol::ThreadPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    it->second.apply_patch(patch, core::time::now_unix_ms());
    return it->second.header();
}

core::errors::Result<std::vector<MemoryThread>> InMemoryMessageStore::list_threads()
    const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryThread> out;
    out.reserve(threads_.size());
    for (const auto& [id, log] : threads_) {
        out.push_back(log.header());
    }
    return out;
}

core::errors::Result<std::size_t> InMemoryMessageStore::delete_thread(
    const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    const std::size_t removed = it->second.messages().size();
    threads_.erase(it);
    return removed;
}

core::errors::Result<std::vector<Message>> InMemoryMessageStore::append_batch(
    const std::string& thread_id, const std::vector<Message>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    StampedBatch batch = it->second.stamp(messages, core::time::now_unix_ms());
    it->second.commit(batch.fresh);
    return std::move(batch.resolved);
}

core::errors::Result<protocol::MessagePage> InMemoryMessageStore::list(
    const std::string& thread_id, const protocol::MessageQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.page(query);
}

core::errors::Result<std::size_t> InMemoryMessageStore::delete_messages(
    const std::string& thread_id, const std::vector<std::string>& message_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    const std::size_t removed = it->second.erase(message_ids);
    if (removed > 0) {
        it->second.touch(core::time::now_unix_ms());
    }
    return removed;
}

core::errors::Result<protocol::ThreadStats> InMemoryMessageStore::stats(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.stats();
}

}  // namespace strand::storage
