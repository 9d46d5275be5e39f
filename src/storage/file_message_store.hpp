#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "storage/message_store.hpp"
#include "storage/thread_log.hpp"

namespace strand::storage {

// Durable store: one JSON-lines file per thread under `root`.
//
// Each line is {"ts_unix_ms", "record", "payload"} where record is one of
// "thread" (full header, last one wins), "message" or "delete". A batch is
// written with a single write and flush before the in-memory view changes,
// so a failed write leaves both the file and the view as they were.
//
// A final line without its newline that fails to parse is the tail of an
// interrupted write; open() drops it and truncates the file. Damage anywhere
// else fails with storage_corrupt_record.
class FileMessageStore : public MessageStore {
    struct OpenTag {
        explicit OpenTag() = default;
    };

public:
    FileMessageStore(OpenTag, std::filesystem::path root);

    static core::errors::Result<std::shared_ptr<FileMessageStore>> open(
        const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

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
    core::errors::Result<std::filesystem::path> thread_path(
        const std::string& thread_id) const;

    core::errors::Result<std::filesystem::path> append_records(
        const std::string& thread_id,
        const std::vector<nlohmann::json>& records) const;

    core::errors::Result<std::size_t> load_thread_file(
        const std::filesystem::path& file);

    mutable std::mutex mutex_;
    std::filesystem::path root_;
    std::map<std::string, ThreadLog> threads_;
};

}  // namespace strand::storage
