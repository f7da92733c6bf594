#pragma once
#include "config.hpp"
#include "conversation_filter.hpp"
#include "message.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>

namespace chatbackup {

class ArchiveIndex;

// Filename-safe form of a conversation key. Bytes outside [A-Za-z0-9._@-]
// (and '%' itself) become %XX, so distinct keys never share a file.
std::string encode_key(const std::string& conversation_key);

// Inverse of encode_key. Malformed escapes are kept literally.
std::string decode_key(const std::string& encoded);

// "{key}_{private|group}.jsonl"
std::string log_filename(const std::string& conversation_key, ChatKind kind);

// Appends one JSON line per accepted message to the conversation's current
// file and rotates that file once it reaches the size threshold.
//
// - record() never throws; false means nothing was persisted (filtered out,
//   invalid input, or an I/O failure that has been logged).
// - The record that pushes a file over the threshold stays in the rotated
//   file; the fresh current file starts empty.
// - A failed rotation leaves the oversized file in place and is retried on
//   the next write to that conversation.
// - Writes to the same conversation are serialized by a per-file mutex.
class BackupLog {
public:
    explicit BackupLog(const Config& cfg, ArchiveIndex* archives = nullptr);

    BackupLog(const BackupLog&) = delete;
    BackupLog& operator=(const BackupLog&) = delete;

    bool record(const std::string& conversation_key, ChatKind kind, MessageRecord message);

    // 0 disables rotation.
    void set_rotate_threshold(uint64_t bytes) { threshold_ = bytes; }
    uint64_t rotate_threshold() const { return threshold_; }

    const fs::path& data_dir() const { return dir_; }
    fs::path current_file(const std::string& conversation_key, ChatKind kind) const;

private:
    fs::path dir_;
    ConversationFilter filter_;
    bool save_system_info_;
    uint64_t threshold_;
    ArchiveIndex* archives_;

    std::mutex slots_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> slots_;

    std::mutex& slot_for(const std::string& filename);
    bool append_line(const fs::path& path, const std::string& line);
    bool over_threshold(const fs::path& path) const;
    bool rotate(const fs::path& path, const std::string& conversation_key, ChatKind kind);
};

} // namespace chatbackup
