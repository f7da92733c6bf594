#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chatbackup {

struct LogName {
    std::string chat_id;
    std::string kind;      // "private", "group" or "unknown"
    bool archived = false; // rotated history file
};

// Splits "{id}_{kind}.jsonl" / "{id}_{kind}_{YYYYMMDD_HHMMSS}[_n].jsonl".
// chat_id comes back decoded (see encode_key).
LogName parse_log_name(const std::string& filename);

struct LogSummary {
    std::string filename;
    LogName name;
    int64_t message_count = 0;  // parseable records only
    double size_kb = 0;
    std::string last_message;   // first 50 characters
    std::string last_time;

    nlohmann::json to_json() const;
};

struct LogPage {
    std::vector<MessageRecord> messages;  // newest first
    int64_t total = 0;
    int page = 1;
    int page_size = 50;

    nlohmann::json to_json() const;
};

struct LogStats {
    int64_t total_chats = 0;
    int64_t total_messages = 0;
    double total_size_mb = 0;
    int64_t private_chats = 0;
    int64_t group_chats = 0;

    nlohmann::json to_json() const;
};

// Read-only view over a backup data directory. Only newline-terminated lines
// count, so files that are still being appended to read consistently.
class LogReader {
public:
    static constexpr int kMaxPageSize = 500;

    explicit LogReader(const std::string& data_dir) : dir_(data_dir) {}

    // Sorted by last message time, newest first.
    std::vector<LogSummary> list_logs() const;

    // nullopt when the file does not exist or the name is not a log file.
    std::optional<LogPage> read_page(const std::string& filename, int page, int page_size) const;

    LogStats stats() const;

    static bool is_safe_filename(const std::string& filename);

private:
    fs::path dir_;

    std::vector<fs::path> log_files() const;
};

} // namespace chatbackup
