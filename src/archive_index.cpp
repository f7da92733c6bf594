#include "archive_index.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace chatbackup {

ArchiveIndex::ArchiveIndex(const std::string& db_path) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open archive index: " + msg);
    }
    try {
        init_db();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

ArchiveIndex::~ArchiveIndex() {
    if (db_) sqlite3_close(db_);
}

void ArchiveIndex::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS archives (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            chat_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            filename TEXT NOT NULL,
            size_bytes INTEGER DEFAULT 0,
            record_count INTEGER DEFAULT 0,
            rotated_at INTEGER DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS archives_chat ON archives(chat_id);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init archive index: " + msg);
    }
}

int64_t ArchiveIndex::add(const ArchiveEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "INSERT INTO archives (chat_id, kind, filename, size_bytes, record_count, rotated_at) VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare archive insert: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, entry.chat_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, entry.kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, entry.size_bytes);
    sqlite3_bind_int64(stmt, 5, entry.record_count);
    sqlite3_bind_int64(stmt, 6, entry.rotated_at);

    int rc = sqlite3_step(stmt);
    int64_t id = sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to add archive entry: " + std::string(sqlite3_errmsg(db_)));
    }
    return id;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::vector<ArchiveEntry> ArchiveIndex::list(const std::string& chat_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ArchiveEntry> entries;
    const char* sql = chat_id.empty()
        ? "SELECT id, chat_id, kind, filename, size_bytes, record_count, rotated_at FROM archives ORDER BY rotated_at DESC, id DESC"
        : "SELECT id, chat_id, kind, filename, size_bytes, record_count, rotated_at FROM archives WHERE chat_id = ? ORDER BY rotated_at DESC, id DESC";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to query archive index: " + std::string(sqlite3_errmsg(db_)));
    }
    if (!chat_id.empty()) {
        sqlite3_bind_text(stmt, 1, chat_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ArchiveEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.chat_id = column_text(stmt, 1);
        e.kind = column_text(stmt, 2);
        e.filename = column_text(stmt, 3);
        e.size_bytes = sqlite3_column_int64(stmt, 4);
        e.record_count = sqlite3_column_int64(stmt, 5);
        e.rotated_at = sqlite3_column_int64(stmt, 6);
        entries.push_back(std::move(e));
    }
    sqlite3_finalize(stmt);
    return entries;
}

int64_t ArchiveIndex::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM archives", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to count archives: " + std::string(sqlite3_errmsg(db_)));
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

} // namespace chatbackup
