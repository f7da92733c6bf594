#include "backup_plugin.hpp"
#include <iostream>

namespace chatbackup {

std::string extract_text(const std::vector<MessageSegment>& segments) {
    std::string out;
    for (auto& seg : segments) {
        if (!seg.text || seg.text->empty()) continue;
        if (!out.empty()) out += ' ';
        out += *seg.text;
    }
    return trim(out);
}

static std::vector<MessageSegment> segments_from(const nlohmann::json& j) {
    std::vector<MessageSegment> segs;
    if (j.contains("segments") && j["segments"].is_array()) {
        for (auto& s : j["segments"]) {
            MessageSegment seg;
            if (s.is_string()) seg.text = s.get<std::string>();
            segs.push_back(std::move(seg));
        }
    } else if (j.contains("text") && j["text"].is_string()) {
        segs.push_back(MessageSegment{j["text"].get<std::string>()});
    }
    return segs;
}

// Hosts send ids as strings or bare numbers. Missing or null reads as empty.
static bool read_id(const nlohmann::json& j, const char* key, std::string& out, std::string& error) {
    out.clear();
    if (!j.contains(key) || j[key].is_null()) return true;
    auto& v = j[key];
    if (v.is_string()) {
        out = v.get<std::string>();
    } else if (v.is_number_unsigned()) {
        out = std::to_string(v.get<uint64_t>());
    } else if (v.is_number_integer()) {
        out = std::to_string(v.get<int64_t>());
    } else {
        error = std::string("'") + key + "' must be a string or integer, got " + v.type_name();
        return false;
    }
    return true;
}

std::optional<HostEvent> parse_host_event(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "event is not an object";
        return std::nullopt;
    }

    std::string type = "message";
    if (j.contains("type")) {
        if (!j["type"].is_string()) {
            error = "'type' must be a string";
            return std::nullopt;
        }
        type = j["type"].get<std::string>();
    }

    HostEvent he;
    if (type == "response") {
        he.response = true;
    } else if (type != "message") {
        error = "unknown event type: " + type;
        return std::nullopt;
    }

    if (!read_id(j, "group_id", he.event.group_id, error) ||
        !read_id(j, "sender_id", he.event.sender_id, error) ||
        !read_id(j, "sender_name", he.event.sender_name, error)) {
        return std::nullopt;
    }
    he.event.segments = segments_from(j);
    return he;
}

BackupPlugin::BackupPlugin(const Config& cfg) : config_(cfg) {
    std::string dir = config_.data_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[plugin] Warning: cannot create data directory " << dir << ": " << ec.message() << "\n";
    }

    // The catalog is optional; backups keep working without it.
    try {
        archives_ = std::make_unique<ArchiveIndex>(dir + "/archives.db");
    } catch (const std::exception& e) {
        std::cerr << "[plugin] Archive index disabled: " << e.what() << "\n";
    }

    log_ = std::make_unique<BackupLog>(config_, archives_.get());
    std::cerr << "[plugin] Chat backup loaded, data directory: " << dir << "\n";
}

BackupPlugin::~BackupPlugin() {
    stop();
    std::cerr << "[plugin] Chat backup unloaded\n";
}

bool BackupPlugin::start() {
    if (!config_.enable_webui) return true;
    if (viewer_ && viewer_->running()) return true;
    viewer_ = std::make_unique<WebViewer>(config_.webui_host, config_.webui_port,
                                          config_.data_path(), archives_.get());
    if (!viewer_->start()) {
        std::cerr << "[plugin] Web viewer failed to start\n";
        viewer_.reset();
        return false;
    }
    return true;
}

void BackupPlugin::stop() {
    if (viewer_) {
        viewer_->stop();
        viewer_.reset();
    }
}

bool BackupPlugin::on_message(const ChatEvent& event) {
    return save(event, "user", event.segments, true);
}

bool BackupPlugin::on_bot_response(const ChatEvent& event, const std::vector<MessageSegment>& reply) {
    return save(event, "assistant", reply, false);
}

bool BackupPlugin::save(const ChatEvent& event, const std::string& role,
                        const std::vector<MessageSegment>& segments, bool with_sender) {
    try {
        std::string content = extract_text(segments);
        if (content.empty()) return false;

        std::string key = event.conversation_key();
        if (key.empty()) return false;

        MessageRecord rec;
        rec.role = role;
        rec.content = std::move(content);
        if (with_sender) {
            rec.sender_id = event.sender_id;
            rec.sender_name = event.sender_name;
        }
        return log_->record(key, event.is_group() ? ChatKind::group : ChatKind::private_chat, std::move(rec));
    } catch (const std::exception& e) {
        std::cerr << "[plugin] Failed to back up " << role << " message: " << e.what() << "\n";
        return false;
    }
}

} // namespace chatbackup
