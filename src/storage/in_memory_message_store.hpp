#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "storage/message_store.hpp"
#include "storage/thread_log.hpp"

namespace strand::storage {

// Process-local store. One mutex serializes every operation.
class InMemoryMessageStore : public MessageStore {
public:
    core::errors::Result<protocol::MemoryThread> create_thread(
        const protocol::MemoryThread& thread) override;
    core::errors::Result<protocol::MemoryThread> get_thread(
        const std::string& thread_id) const override;
    core::errors::Result<protocol::MemoryThread> update_thread(
        const std::string& thread_id, const protocol::ThreadPatch& patch) override;
    core::errors::Result<std::vector<protocol::MemoryThread>> list_threads()
        const override;
    core::errors::Result<std::size_t> delete_thread(
        const std::string& thread_id) override;
    core::errors::Result<std::vector<protocol::Message>> append_batch(
        const std::string& thread_id,
        const std::vector<protocol::Message>& messages) override;
    core::errors::Result<protocol::MessagePage> list(
        const std::string& thread_id,
        const protocol::MessageQuery& query) const override;
    core::errors::Result<std::size_t> delete_messages(
        const std::string& thread_id,
        const std::vector<std::string>& message_ids) override;
    core::errors::Result<protocol::ThreadStats> stats(
        const std::string& thread_id) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ThreadLog> threads_;
};

}  // namespace strand::storage
