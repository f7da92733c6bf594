#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

namespace chatbackup {

// One rotated history file.
struct ArchiveEntry {
    int64_t id = 0;
    std::string chat_id;
    std::string kind;          // "private" or "group"
    std::string filename;      // name inside the data directory
    int64_t size_bytes = 0;
    int64_t record_count = 0;
    int64_t rotated_at = 0;    // epoch seconds
};

class ArchiveIndex {
public:
    explicit ArchiveIndex(const std::string& db_path);
    ~ArchiveIndex();

    ArchiveIndex(const ArchiveIndex&) = delete;
    ArchiveIndex& operator=(const ArchiveIndex&) = delete;

    int64_t add(const ArchiveEntry& entry);
    // Newest first; empty chat_id lists every conversation.
    std::vector<ArchiveEntry> list(const std::string& chat_id = "");
    int64_t count();

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    void init_db();
};

} // namespace chatbackup
