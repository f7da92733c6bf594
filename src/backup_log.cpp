#include "backup_log.hpp"
#include "archive_index.hpp"
#include <fstream>
#include <iostream>
#include <system_error>

namespace chatbackup {

std::string encode_key(const std::string& conversation_key) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(conversation_key.size());
    for (char c : conversation_key) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '_' || c == '@' || c == '-';
        if (ok) {
            out += c;
        } else {
            unsigned char u = static_cast<unsigned char>(c);
            out += '%';
            out += hex[u >> 4];
            out += hex[u & 0x0F];
        }
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string decode_key(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); i++) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += encoded[i];
    }
    return out;
}

std::string log_filename(const std::string& conversation_key, ChatKind kind) {
    return encode_key(conversation_key) + "_" + kind_name(kind) + ".jsonl";
}

static int64_t count_lines(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return 0;
    int64_t n = 0;
    char buf[8192];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0) {
        for (std::streamsize i = 0; i < f.gcount(); i++) {
            if (buf[i] == '\n') n++;
        }
    }
    return n;
}

BackupLog::BackupLog(const Config& cfg, ArchiveIndex* archives)
    : dir_(cfg.data_path())
    , filter_(cfg)
    , save_system_info_(cfg.save_system_info)
    , threshold_(cfg.max_file_size_bytes())
    , archives_(archives) {}

fs::path BackupLog::current_file(const std::string& conversation_key, ChatKind kind) const {
    return dir_ / log_filename(conversation_key, kind);
}

std::mutex& BackupLog::slot_for(const std::string& filename) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[filename];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

bool BackupLog::record(const std::string& conversation_key, ChatKind kind, MessageRecord message) {
    if (conversation_key.empty()) {
        std::cerr << "[backup] Rejected record: empty conversation key\n";
        return false;
    }
    if (!filter_.allows(conversation_key, kind)) return false;
    if (!is_valid_role(message.role)) {
        std::cerr << "[backup] Rejected record for " << conversation_key
                  << ": invalid role '" << message.role << "'\n";
        return false;
    }
    if (message.content.empty()) {
        std::cerr << "[backup] Rejected record for " << conversation_key << ": empty content\n";
        return false;
    }

    if (!save_system_info_) {
        message.sender_id.clear();
        message.sender_name.clear();
    }
    if (message.timestamp.empty()) message.timestamp = iso_now();

    std::string line;
    try {
        line = message.to_line();
    } catch (const std::exception& e) {
        std::cerr << "[backup] Failed to serialize record for " << conversation_key << ": " << e.what() << "\n";
        return false;
    }

    fs::path path = current_file(conversation_key, kind);
    std::lock_guard<std::mutex> lock(slot_for(path.filename().string()));

    // A rotation that failed on an earlier write gets another attempt here.
    if (over_threshold(path)) rotate(path, conversation_key, kind);

    if (!append_line(path, line)) return false;

    if (over_threshold(path)) rotate(path, conversation_key, kind);
    return true;
}

bool BackupLog::append_line(const fs::path& path, const std::string& line) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[backup] Failed to create data directory " << dir_.string() << ": " << ec.message() << "\n";
        return false;
    }

    uint64_t before = 0;
    if (fs::exists(path, ec)) {
        before = fs::file_size(path, ec);
        if (ec) before = 0;
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        std::cerr << "[backup] Failed to open " << path.string() << " for append\n";
        return false;
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        out.close();
        // Drop whatever part of the line made it to disk.
        std::error_code trunc_ec;
        fs::resize_file(path, before, trunc_ec);
        std::cerr << "[backup] Failed to write " << path.string() << ", record dropped\n";
        return false;
    }
    return true;
}

bool BackupLog::over_threshold(const fs::path& path) const {
    if (threshold_ == 0) return false;
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return !ec && size >= threshold_;
}

bool BackupLog::rotate(const fs::path& path, const std::string& conversation_key, ChatKind kind) {
    std::string base = path.stem().string() + "_" + rotation_stamp();
    fs::path target = dir_ / (base + ".jsonl");
    std::error_code ec;
    for (int n = 1; fs::exists(target, ec); n++) {
        target = dir_ / (base + "_" + std::to_string(n) + ".jsonl");
    }

    uint64_t size = fs::file_size(path, ec);
    if (ec) size = 0;
    int64_t records = archives_ ? count_lines(path) : 0;

    fs::rename(path, target, ec);
    if (ec) {
        std::cerr << "[backup] Rotation of " << path.filename().string() << " failed: "
                  << ec.message() << ", will retry on next write\n";
        return false;
    }

    {
        std::ofstream fresh(path, std::ios::binary | std::ios::app);
        if (!fresh) {
            std::cerr << "[backup] Could not create fresh " << path.filename().string() << "\n";
        }
    }
    std::cerr << "[backup] Rotated " << path.filename().string() << " -> " << target.filename().string() << "\n";

    if (archives_) {
        ArchiveEntry entry;
        entry.chat_id = conversation_key;
        entry.kind = kind_name(kind);
        entry.filename = target.filename().string();
        entry.size_bytes = static_cast<int64_t>(size);
        entry.record_count = records;
        entry.rotated_at = epoch_now();
        try {
            archives_->add(entry);
        } catch (const std::exception& e) {
            std::cerr << "[archive] Failed to catalog " << entry.filename << ": " << e.what() << "\n";
        }
    }
    return true;
}

} // namespace chatbackup
