#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chatbackup {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["data_dir"] = data_dir;
    j["enable_private"] = enable_private;
    j["enable_group"] = enable_group;
    j["group_whitelist"] = group_whitelist;
    j["group_blacklist"] = group_blacklist;
    j["save_system_info"] = save_system_info;
    j["max_file_size_mb"] = max_file_size_mb;
    j["enable_webui"] = enable_webui;
    j["webui_host"] = webui_host;
    j["webui_port"] = webui_port;
    return j;
}

static void warn_invalid(const std::string& key, const std::string& why) {
    std::cerr << "[config] Warning: invalid '" << key << "' (" << why << "), using default\n";
}

static bool read_bool(const nlohmann::json& j, const char* key, bool fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_boolean()) {
        warn_invalid(key, "expected true/false");
        return fallback;
    }
    return j[key].get<bool>();
}

static int read_int(const nlohmann::json& j, const char* key, int fallback, int lo, int hi) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_number_integer()) {
        warn_invalid(key, "expected an integer");
        return fallback;
    }
    int64_t v = j[key].get<int64_t>();
    if (v < lo || v > hi) {
        warn_invalid(key, "out of range " + std::to_string(lo) + ".." + std::to_string(hi));
        return fallback;
    }
    return static_cast<int>(v);
}

static std::string read_string(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        warn_invalid(key, "expected a non-empty string");
        return fallback;
    }
    return j[key].get<std::string>();
}

// Group ids arrive as strings or bare numbers depending on the platform.
static std::vector<std::string> parse_id_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;
    auto& arr = j[key];
    if (!arr.is_array()) {
        warn_invalid(key, "expected a list of ids");
        return result;
    }
    for (auto& item : arr) {
        if (item.is_string()) {
            if (!item.get<std::string>().empty()) result.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            result.push_back(std::to_string(item.get<int64_t>()));
        } else {
            std::cerr << "[config] Warning: ignoring non-id entry in '" << key << "': " << item.dump() << "\n";
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    if (!j.is_object()) {
        std::cerr << "[config] Warning: config root is not an object, using defaults\n";
        return c;
    }

    c.data_dir = read_string(j, "data_dir", c.data_dir);
    c.enable_private = read_bool(j, "enable_private", c.enable_private);
    c.enable_group = read_bool(j, "enable_group", c.enable_group);
    c.group_whitelist = parse_id_array(j, "group_whitelist");
    c.group_blacklist = parse_id_array(j, "group_blacklist");
    c.save_system_info = read_bool(j, "save_system_info", c.save_system_info);
    c.max_file_size_mb = read_int(j, "max_file_size_mb", c.max_file_size_mb, 1, 1024 * 1024);
    c.enable_webui = read_bool(j, "enable_webui", c.enable_webui);
    c.webui_host = read_string(j, "webui_host", c.webui_host);
    c.webui_port = read_int(j, "webui_port", c.webui_port, 1, 65535);

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("Failed to write config: " + path);
    }
    f << to_json().dump(2) << std::endl;
}

} // namespace chatbackup
