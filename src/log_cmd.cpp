#include "commands.hpp"
#include "config.hpp"
#include "backup_plugin.hpp"
#include "log_reader.hpp"
#include <iostream>

namespace chatbackup {

int cmd_record(const std::string& config_path, const std::vector<std::string>& args) {
    std::string chat, role, content, sender_id, sender_name;
    bool group = false;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--chat" && i + 1 < args.size()) {
            chat = args[++i];
        } else if (args[i] == "--group") {
            group = true;
        } else if (args[i] == "--role" && i + 1 < args.size()) {
            role = args[++i];
        } else if (args[i] == "--content" && i + 1 < args.size()) {
            content = args[++i];
        } else if (args[i] == "--sender-id" && i + 1 < args.size()) {
            sender_id = args[++i];
        } else if (args[i] == "--sender-name" && i + 1 < args.size()) {
            sender_name = args[++i];
        }
    }

    if (chat.empty() || content.empty() || !is_valid_role(role)) {
        std::cerr << "Usage: chatbackup record --chat ID [--group] --role user|assistant --content TEXT\n"
                  << "                         [--sender-id ID] [--sender-name NAME]\n";
        return 1;
    }

    Config cfg = Config::load(config_path);
    BackupPlugin plugin(cfg);

    MessageRecord rec;
    rec.role = role;
    rec.content = content;
    rec.sender_id = sender_id;
    rec.sender_name = sender_name;
    ChatKind kind = group ? ChatKind::group : ChatKind::private_chat;
    if (!plugin.log().record(chat, kind, rec)) {
        std::cerr << "Not recorded (filtered out or write failed)\n";
        return 1;
    }
    std::cout << "Recorded to " << plugin.log().current_file(chat, kind).string() << "\n";
    return 0;
}

// One JSON event per stdin line; see parse_host_event for the shape.
int cmd_ingest(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    BackupPlugin plugin(cfg);

    int64_t saved = 0, skipped = 0, bad = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (trim(line).empty()) continue;
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ingest] Skipping malformed line: " << e.what() << "\n";
            bad++;
            continue;
        }
        std::string error;
        auto ev = parse_host_event(j, error);
        if (!ev) {
            std::cerr << "[ingest] Skipping event: " << error << "\n";
            bad++;
            continue;
        }

        bool ok = ev->response ? plugin.on_bot_response(ev->event, ev->event.segments)
                               : plugin.on_message(ev->event);
        if (ok) saved++; else skipped++;
    }

    std::cout << "Saved " << saved << ", skipped " << skipped << ", malformed " << bad << "\n";
    return 0;
}

int cmd_list(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    auto logs = LogReader(cfg.data_path()).list_logs();
    if (logs.empty()) {
        std::cout << "No backups.\n";
        return 0;
    }
    for (auto& s : logs) {
        std::cout << s.filename << "  " << s.name.kind << (s.name.archived ? " (archived)" : "")
                  << "  " << s.message_count << " msgs  " << s.size_kb << " KB";
        if (!s.last_time.empty()) std::cout << "  last " << s.last_time;
        std::cout << "\n";
    }
    return 0;
}

int cmd_show(const std::string& config_path, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: chatbackup show FILE [--page N] [--size N]\n";
        return 1;
    }
    int page = 1, size = 20;
    for (size_t i = 1; i < args.size(); i++) {
        try {
            if (args[i] == "--page" && i + 1 < args.size()) {
                page = std::stoi(args[++i]);
            } else if (args[i] == "--size" && i + 1 < args.size()) {
                size = std::stoi(args[++i]);
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid number: " << args[i] << "\n";
            return 1;
        }
    }

    Config cfg = Config::load(config_path);
    auto result = LogReader(cfg.data_path()).read_page(args[0], page, size);
    if (!result) {
        std::cerr << "Chat not found: " << args[0] << "\n";
        return 1;
    }
    std::cout << args[0] << ": page " << result->page << ", " << result->total << " records\n";
    for (auto& m : result->messages) {
        std::cout << "[" << m.timestamp << "] "
                  << (m.sender_name.empty() ? m.role : m.sender_name) << ": " << m.content << "\n";
    }
    return 0;
}

int cmd_stats(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    std::cout << LogReader(cfg.data_path()).stats().to_json().dump(2) << "\n";
    return 0;
}

int cmd_archives(const std::string& config_path, const std::vector<std::string>& args) {
    std::string chat;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--chat" && i + 1 < args.size()) chat = args[++i];
    }

    Config cfg = Config::load(config_path);
    try {
        ArchiveIndex index(cfg.data_path() + "/archives.db");
        auto entries = index.list(chat);
        if (entries.empty()) {
            std::cout << "No rotated files.\n";
            return 0;
        }
        for (auto& a : entries) {
            std::cout << "id=" << a.id << " chat=" << a.chat_id << " type=" << a.kind
                      << " file=" << a.filename << " records=" << a.record_count
                      << " bytes=" << a.size_bytes << " rotated_at=" << a.rotated_at << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Archive index error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace chatbackup
