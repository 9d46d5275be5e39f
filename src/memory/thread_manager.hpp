#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/thread_contract.hpp"
#include "storage/message_store.hpp"

namespace strand::memory {

// Thread lifecycle and message access on top of a MessageStore.
//
// Metadata updates are partial merges performed by the store under its
// lock, so concurrent writers touching different keys never drop each
// other's values. Removing a thread deletes its messages for good.
//
// Every per-thread operation takes an optional `resource_id`. When set, a
// thread owned by another resource (or by none) fails with AccessDenied
// before anything is read or written.
class ThreadManager {
public:
    explicit ThreadManager(std::shared_ptr<storage::MessageStore> store);

    core::errors::Result<protocol::MemoryThread> create(
        const protocol::CreateThreadParams& params);

    core::errors::Result<protocol::MemoryThread> get(
        const std::string& thread_id,
        const std::optional<std::string>& resource_id = std::nullopt) const;

    core::errors::Result<protocol::MemoryThread> update(
        const std::string& thread_id, const protocol::ThreadPatch& patch,
        const std::optional<std::string>& resource_id = std::nullopt);

    core::errors::Result<std::size_t> remove(
        const std::string& thread_id,
        const std::optional<std::string>& resource_id = std::nullopt);

    core::errors::Result<std::vector<protocol::MemoryThread>> list_threads(
        const protocol::ThreadQuery& query = {}) const;

    core::errors::Result<protocol::Message> add_message(
        const std::string& thread_id, const protocol::Message& message,
        const std::optional<std::string>& resource_id = std::nullopt);

    // Appended as one unit; no other writer's message lands in between.
    core::errors::Result<std::vector<protocol::Message>> add_messages(
        const std::string& thread_id, const std::vector<protocol::Message>& messages,
        const std::optional<std::string>& resource_id = std::nullopt);

    core::errors::Result<protocol::MessagePage> get_messages(
        const std::string& thread_id, const protocol::MessageQuery& query = {},
        const std::optional<std::string>& resource_id = std::nullopt) const;

    // Follows cursors to the end. `tail` > 0 keeps only the newest `tail` messages.
    core::errors::Result<std::vector<protocol::Message>> get_history(
        const std::string& thread_id, std::size_t tail = 0,
        const std::optional<std::string>& resource_id = std::nullopt) const;

    core::errors::Result<std::size_t> delete_messages(
        const std::string& thread_id, const std::vector<std::string>& message_ids,
        const std::optional<std::string>& resource_id = std::nullopt);

    core::errors::Result<protocol::ThreadStats> stats(
        const std::string& thread_id,
        const std::optional<std::string>& resource_id = std::nullopt) const;

    // Messages matching `query.role` and `query.keywords` across every thread
    // selected by `scope`, threads in list_threads() order and messages in
    // sequence order. At most `query.limit` results; cursor and reverse are
    // ignored.
    core::errors::Result<std::vector<protocol::Message>> search_messages(
        const protocol::MessageQuery& query, const protocol::ThreadQuery& scope = {}) const;

private:
    core::errors::Result<protocol::MemoryThread> check_owner(
        const std::string& thread_id, const std::optional<std::string>& resource_id) const;

    static core::errors::Result<protocol::Message> validate_message(
        const protocol::Message& message);

    std::shared_ptr<storage::MessageStore> store_;
};

}  // namespace strand::memory
