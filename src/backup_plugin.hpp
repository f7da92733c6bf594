#pragma once
#include "config.hpp"
#include "backup_log.hpp"
#include "archive_index.hpp"
#include "web_viewer.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

namespace chatbackup {

// One piece of a platform message. Images, stickers and the like carry no text.
struct MessageSegment {
    std::optional<std::string> text;
};

// What the host bot hands over for each message event.
struct ChatEvent {
    std::string group_id;       // empty for private chats
    std::string sender_id;
    std::string sender_name;
    std::vector<MessageSegment> segments;

    bool is_group() const { return !group_id.empty(); }
    std::string conversation_key() const { return is_group() ? group_id : sender_id; }
};

// Text segments joined by single spaces, trimmed.
std::string extract_text(const std::vector<MessageSegment>& segments);

// One event from the ingest stream. For a reply, event.segments holds the
// reply text.
struct HostEvent {
    bool response = false;
    ChatEvent event;
};

// {"type":"message"|"response","group_id":..,"sender_id":..,"sender_name":..,
//  "text":".." | "segments":[..]}. Ids may be strings or integers. Returns
// nullopt with the reason in error for anything else.
std::optional<HostEvent> parse_host_event(const nlohmann::json& j, std::string& error);

// Entry point for the host bot: one call per incoming message and one per
// outgoing reply. Calls never throw; a false return means nothing was saved.
class BackupPlugin {
public:
    explicit BackupPlugin(const Config& cfg);
    ~BackupPlugin();

    BackupPlugin(const BackupPlugin&) = delete;
    BackupPlugin& operator=(const BackupPlugin&) = delete;

    bool on_message(const ChatEvent& event);
    bool on_bot_response(const ChatEvent& event, const std::vector<MessageSegment>& reply);

    // Starts the web viewer when enabled in config.
    bool start();
    void stop();

    BackupLog& log() { return *log_; }
    ArchiveIndex* archives() { return archives_.get(); }
    WebViewer* viewer() { return viewer_.get(); }

private:
    Config config_;
    std::unique_ptr<ArchiveIndex> archives_;
    std::unique_ptr<BackupLog> log_;
    std::unique_ptr<WebViewer> viewer_;

    bool save(const ChatEvent& event, const std::string& role,
              const std::vector<MessageSegment>& segments, bool with_sender);
};

} // namespace chatbackup
