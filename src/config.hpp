#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace chatbackup {

struct Config {
    std::string data_dir = "~/.chatbackup/data";

    // Which conversations get backed up
    bool enable_private = true;
    bool enable_group = true;
    std::vector<std::string> group_whitelist;  // empty = all groups
    std::vector<std::string> group_blacklist;

    bool save_system_info = true;   // keep sender_id / sender_name
    int max_file_size_mb = 50;      // rotate once the current file reaches this

    // Web viewer
    bool enable_webui = false;
    std::string webui_host = "0.0.0.0";
    int webui_port = 8866;

    std::string data_path() const {
        return expand_path(data_dir);
    }

    uint64_t max_file_size_bytes() const {
        return static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024;
    }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace chatbackup
