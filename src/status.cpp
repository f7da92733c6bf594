#include "commands.hpp"
#include "config.hpp"
#include "log_reader.hpp"
#include <iostream>

namespace chatbackup {

static std::string join_ids(const std::vector<std::string>& ids) {
    if (ids.empty()) return "(none)";
    std::string out;
    for (auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

int cmd_init(const std::string& config_path) {
    if (fs::exists(config_path)) {
        std::cout << "Config already exists at " << config_path << "\n";
        return 0;
    }
    try {
        Config cfg = Config::make_default();
        cfg.save(config_path);
        fs::create_directories(cfg.data_path());
        std::cout << "Wrote default config to " << config_path << "\n";
        std::cout << "Backups go to " << cfg.data_path() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Init failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== chatbackup status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Data dir     : " << cfg.data_path() << "\n";
    std::cout << "Private      : " << (cfg.enable_private ? "on" : "off") << "\n";
    std::cout << "Groups       : " << (cfg.enable_group ? "on" : "off") << "\n";
    std::cout << "Whitelist    : " << join_ids(cfg.group_whitelist) << "\n";
    std::cout << "Blacklist    : " << join_ids(cfg.group_blacklist) << "\n";
    std::cout << "Sender info  : " << (cfg.save_system_info ? "saved" : "stripped") << "\n";
    std::cout << "Rotate at    : " << cfg.max_file_size_mb << " MB\n";
    if (cfg.enable_webui) {
        std::cout << "Web viewer   : http://" << cfg.webui_host << ":" << cfg.webui_port << "\n";
    } else {
        std::cout << "Web viewer   : off\n";
    }

    LogStats st = LogReader(cfg.data_path()).stats();
    std::cout << "Log files    : " << st.total_chats
              << " (" << st.private_chats << " private, " << st.group_chats << " group)\n";
    std::cout << "Messages     : " << st.total_messages << "\n";
    std::cout << "Storage      : " << st.total_size_mb << " MB\n";
    return 0;
}

} // namespace chatbackup
