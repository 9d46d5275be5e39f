#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/thread_contract.hpp"

namespace strand::storage {

// Outcome of stamping a batch before it is committed.
struct StampedBatch {
    std::vector<protocol::Message> resolved;  // one entry per input, in order
    std::vector<protocol::Message> fresh;     // entries that still need storing
};

// In-memory state of one thread: header, ordered messages, sequence counter.
// Not synchronized; the owning store holds its lock around every call.
class ThreadLog {
public:
    explicit ThreadLog(protocol::MemoryThread header);

    const protocol::MemoryThread& header() const { return header_; }
    const std::vector<protocol::Message>& messages() const { return messages_; }

    // Header as it would look after the patch; the log is unchanged.
    protocol::MemoryThread patched_header(const protocol::ThreadPatch& patch,
                                          std::int64_t now_ms) const;
    void set_header(protocol::MemoryThread header);
    void apply_patch(const protocol::ThreadPatch& patch, std::int64_t now_ms);
    void touch(std::int64_t now_ms);

    std::optional<protocol::Message> find(const std::string& message_id) const;

    // Assigns ids, sequences and timestamps without changing the log.
    StampedBatch stamp(const std::vector<protocol::Message>& batch,
                       std::int64_t now_ms) const;

    void commit(const std::vector<protocol::Message>& stamped);

    core::errors::Result<protocol::MessagePage> page(
        const protocol::MessageQuery& query) const;

    std::size_t erase(const std::vector<std::string>& message_ids);

    // Next sequence to hand out. Never moves backwards, so sequences of
    // erased messages are not reused.
    std::uint64_t next_sequence() const { return next_sequence_; }
    void advance_sequence(std::uint64_t next);

    protocol::ThreadStats stats() const;

private:
    void rebuild_index();

    protocol::MemoryThread header_;
    std::vector<protocol::Message> messages_;
    std::unordered_map<std::string, std::size_t> index_by_id_;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace strand::storage
