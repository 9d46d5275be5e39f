#include "storage/file_message_store.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"
#include "protocol/json_codec.hpp"

namespace strand::storage {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::MemoryThread;
using protocol::Message;

namespace {

constexpr const char* kExtension = ".jsonl";

bool is_safe_thread_id(const std::string& id) {
    if (id.empty() || id.front() == '.') {
        return false;
    }
    for (const char c : id) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0 ||
                             c == '-' || c == '_' || c == '.';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

json make_record(const char* kind, json payload) {
    json record;
    record["ts_unix_ms"] = core::time::now_unix_ms();
    record["record"] = kind;
    record["payload"] = std::move(payload);
    return record;
}

AgentError corrupt(const std::filesystem::path& file, std::size_t line_no,
                   const std::string& what) {
    return AgentError{ErrorCategory::Storage,
                      "Corrupt record at " + file.string() + ":" +
                          std::to_string(line_no) + ": " + what,
                      "storage_corrupt_record"};
}

}  // namespace

FileMessageStore::FileMessageStore(OpenTag, std::filesystem::path root)
    : root_(std::move(root)) {}

core::errors::Result<std::shared_ptr<FileMessageStore>> FileMessageStore::open(
    const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to create store directory: " + root.string() +
                              " (" + ec.message() + ")",
                          "storage_dir_create_failed"};
    }
    const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to resolve store directory: " + root.string(),
                          "storage_dir_invalid"};
    }

    auto store = std::make_shared<FileMessageStore>(OpenTag{}, canonical_root);
    for (const auto& entry : std::filesystem::directory_iterator(canonical_root, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec ||
            entry.path().extension() != kExtension) {
            continue;
        }
        auto loaded = store->load_thread_file(entry.path());
        if (core::errors::is_error(loaded)) {
            return core::errors::get_error(loaded);
        }
    }
    if (ec) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to scan store directory: " +
                              canonical_root.string() + " (" + ec.message() + ")",
                          "storage_scan_failed"};
    }

    STRAND_LOG_DEBUG("FileMessageStore: opened " + canonical_root.string() + " with " +
                     std::to_string(store->threads_.size()) + " threads");
    return store;
}

core::errors::Result<std::size_t> FileMessageStore::load_thread_file(
    const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to open thread file: " + file.string(),
                          "storage_open_failed"};
    }

    const std::string expected_id = file.stem().string();
    std::string line;
    std::size_t line_no = 0;
    std::size_t records = 0;
    std::uintmax_t good_bytes = 0;
    bool torn_tail = false;
    bool missing_newline = false;
    while (std::getline(in, line)) {
        ++line_no;
        const bool terminated = !in.eof();
        if (line.empty()) {
            good_bytes += 1;
            continue;
        }
        const json record = json::parse(line, nullptr, false);
        if (record.is_discarded() && !terminated) {
            torn_tail = true;
            break;
        }
        if (record.is_discarded() || !record.is_object() ||
            !record.contains("record") || !record.contains("payload")) {
            return corrupt(file, line_no, "not a store record");
        }

        const std::string kind = record["record"].is_string()
                                     ? record["record"].get<std::string>()
                                     : "";
        const json& payload = record["payload"];
        auto it = threads_.find(expected_id);

        if (kind == "thread") {
            auto header = protocol::thread_from_json(payload);
            if (core::errors::is_error(header)) {
                return corrupt(file, line_no, core::errors::get_error(header).message);
            }
            if (it == threads_.end()) {
                threads_.emplace(expected_id, ThreadLog(core::errors::get_value(header)));
            } else {
                it->second.set_header(core::errors::get_value(header));
            }
        } else if (kind == "message") {
            if (it == threads_.end()) {
                return corrupt(file, line_no, "message before thread header");
            }
            auto message = protocol::message_from_json(payload);
            if (core::errors::is_error(message)) {
                return corrupt(file, line_no, core::errors::get_error(message).message);
            }
            it->second.commit({core::errors::get_value(message)});
        } else if (kind == "delete") {
            if (it == threads_.end() || !payload.contains("ids") ||
                !payload["ids"].is_array()) {
                return corrupt(file, line_no, "invalid delete record");
            }
            std::vector<std::string> ids;
            for (const auto& id : payload["ids"]) {
                if (!id.is_string()) {
                    return corrupt(file, line_no, "invalid delete record");
                }
                ids.push_back(id.get<std::string>());
            }
            it->second.erase(ids);
            auto next_it = payload.find("next_sequence");
            if (next_it != payload.end() && next_it->is_number_unsigned()) {
                it->second.advance_sequence(next_it->get<std::uint64_t>());
            }
        } else {
            return corrupt(file, line_no, "unknown record kind '" + kind + "'");
        }
        ++records;
        good_bytes += line.size() + (terminated ? 1 : 0);
        missing_newline = !terminated;
    }

    if (!torn_tail && !in.eof()) {
        return AgentError{ErrorCategory::Storage,
                          "I/O error while reading thread file: " + file.string(),
                          "storage_read_failed"};
    }
    in.close();

    if (torn_tail) {
        STRAND_LOG_WARN("FileMessageStore: dropping incomplete record at " + file.string() +
                        ":" + std::to_string(line_no));
        std::error_code ec;
        std::filesystem::resize_file(file, good_bytes, ec);
        if (ec) {
            return AgentError{ErrorCategory::Storage,
                              "Unable to truncate thread file: " + file.string() + " (" +
                                  ec.message() + ")",
                              "storage_write_failed"};
        }
    } else if (missing_newline) {
        // Complete record whose newline never reached the disk.
        std::ofstream out(file, std::ios::app);
        out << "\n";
        out.flush();
        if (!out.good()) {
            return AgentError{ErrorCategory::Storage,
                              "Unable to write thread file: " + file.string(),
                              "storage_write_failed"};
        }
    }
    return records;
}

core::errors::Result<std::filesystem::path> FileMessageStore::thread_path(
    const std::string& thread_id) const {
    if (!is_safe_thread_id(thread_id)) {
        return AgentError{ErrorCategory::Validation,
                          "Thread id is not usable as a file name: " + thread_id,
                          "invalid_thread_id",
                          "Use letters, digits, '-', '_' or '.'."};
    }
    return root_ / (thread_id + kExtension);
}

core::errors::Result<std::filesystem::path> FileMessageStore::append_records(
    const std::string& thread_id, const std::vector<json>& records) const {
    auto path_result = thread_path(thread_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::string buffer;
    for (const auto& record : records) {
        buffer += protocol::to_line(record);
        buffer += "\n";
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to open thread file: " + path.string(),
                          "storage_open_failed"};
    }
    out << buffer;
    out.flush();
    if (!out.good()) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to write thread file: " + path.string(),
                          "storage_write_failed"};
    }
    return path;
}

core::errors::Result<MemoryThread> FileMessageStore::create_thread(
    const MemoryThread& thread) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (threads_.find(thread.id) != threads_.end()) {
        return AgentError{ErrorCategory::Validation,
                          "Thread already exists: " + thread.id, "thread_exists"};
    }
    auto written =
        append_records(thread.id, {make_record("thread", protocol::thread_to_json(thread))});
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    auto [it, inserted] = threads_.emplace(thread.id, ThreadLog(thread));
    static_cast<void>(inserted);
    return it->second.header();
}

core::errors::Result<MemoryThread> FileMessageStore::get_thread(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.header();
}

core::errors::Result<MemoryThread> FileMessageStore::update_thread(
    const std::string& thread_id, const protocol::ThreadPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    MemoryThread next = it->second.patched_header(patch, core::time::now_unix_ms());
    auto written =
        append_records(thread_id, {make_record("thread", protocol::thread_to_json(next))});
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    it->second.set_header(std::move(next));
    return it->second.header();
}

core::errors::Result<std::vector<MemoryThread>> FileMessageStore::list_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryThread> out;
    out.reserve(threads_.size());
    for (const auto& [id, log] : threads_) {
        out.push_back(log.header());
    }
    return out;
}

core::errors::Result<std::size_t> FileMessageStore::delete_thread(
    const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    auto path_result = thread_path(thread_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }

    std::error_code ec;
    std::filesystem::remove(core::errors::get_value(path_result), ec);
    if (ec) {
        return AgentError{ErrorCategory::Storage,
                          "Unable to remove thread file for " + thread_id + ": " +
                              ec.message(),
                          "storage_delete_failed"};
    }
    const std::size_t removed = it->second.messages().size();
    threads_.erase(it);
    return removed;
}

core::errors::Result<std::vector<Message>> FileMessageStore::append_batch(
    const std::string& thread_id, const std::vector<Message>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }

    StampedBatch batch = it->second.stamp(messages, core::time::now_unix_ms());
    if (!batch.fresh.empty()) {
        std::vector<json> records;
        records.reserve(batch.fresh.size());
        for (const auto& message : batch.fresh) {
            records.push_back(make_record("message", protocol::message_to_json(message)));
        }
        auto written = append_records(thread_id, records);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        it->second.commit(batch.fresh);
    }
    return std::move(batch.resolved);
}

core::errors::Result<protocol::MessagePage> FileMessageStore::list(
    const std::string& thread_id, const protocol::MessageQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.page(query);
}

core::errors::Result<std::size_t> FileMessageStore::delete_messages(
    const std::string& thread_id, const std::vector<std::string>& message_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    if (message_ids.empty()) {
        return std::size_t{0};
    }

    json payload;
    payload["ids"] = message_ids;
    payload["next_sequence"] = it->second.next_sequence();
    auto written = append_records(thread_id, {make_record("delete", payload)});
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    const std::size_t removed = it->second.erase(message_ids);
    if (removed > 0) {
        it->second.touch(core::time::now_unix_ms());
    }
    return removed;
}

core::errors::Result<protocol::ThreadStats> FileMessageStore::stats(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return thread_not_found(thread_id);
    }
    return it->second.stats();
}

}  // namespace strand::storage
