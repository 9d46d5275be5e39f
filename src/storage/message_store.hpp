#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/thread_contract.hpp"

namespace strand::storage {

// Durable, key-ordered append storage keyed by thread id.
//
// Every mutation goes through these operations. Implementations serialize
// appends so a batch is never interleaved with another writer's messages
// and sequence numbers are unique and strictly increasing per thread.
//
// Failures: NotFound when the thread is absent, Storage for backend faults.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual core::errors::Result<protocol::MemoryThread> create_thread(
        const protocol::MemoryThread& thread) = 0;

    virtual core::errors::Result<protocol::MemoryThread> get_thread(
        const std::string& thread_id) const = 0;

    // Merges the patch into the stored header under the store lock.
    virtual core::errors::Result<protocol::MemoryThread> update_thread(
        const std::string& thread_id, const protocol::ThreadPatch& patch) = 0;

    virtual core::errors::Result<std::vector<protocol::MemoryThread>> list_threads()
        const = 0;

    // Removes the thread and all of its messages. Returns the message count removed.
    virtual core::errors::Result<std::size_t> delete_thread(
        const std::string& thread_id) = 0;

    // All-or-nothing. Messages carrying an id already present in the thread
    // are not stored again; the stored copy is returned in their place.
    virtual core::errors::Result<std::vector<protocol::Message>> append_batch(
        const std::string& thread_id,
        const std::vector<protocol::Message>& messages) = 0;

    virtual core::errors::Result<protocol::MessagePage> list(
        const std::string& thread_id, const protocol::MessageQuery& query) const = 0;

    virtual core::errors::Result<std::size_t> delete_messages(
        const std::string& thread_id,
        const std::vector<std::string>& message_ids) = 0;

    virtual core::errors::Result<protocol::ThreadStats> stats(
        const std::string& thread_id) const = 0;

    core::errors::Result<protocol::Message> append(const std::string& thread_id,
                                                   const protocol::Message& message);
};

core::errors::AgentError thread_not_found(const std::string& thread_id);

}  // namespace strand::storage
