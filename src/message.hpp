#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace chatbackup {

enum class ChatKind { private_chat, group };

inline const char* kind_name(ChatKind kind) {
    return kind == ChatKind::group ? "group" : "private";
}

inline std::optional<ChatKind> parse_kind(const std::string& s) {
    if (s == "private") return ChatKind::private_chat;
    if (s == "group") return ChatKind::group;
    return std::nullopt;
}

inline bool is_valid_role(const std::string& role) {
    return role == "user" || role == "assistant";
}

struct MessageRecord {
    std::string timestamp;      // ISO-8601, filled in on write when empty
    std::string role;           // "user" or "assistant"
    std::string content;
    std::string sender_id;      // optional
    std::string sender_name;    // optional

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["timestamp"] = timestamp;
        j["role"] = role;
        j["content"] = content;
        if (!sender_id.empty()) j["sender_id"] = sender_id;
        if (!sender_name.empty()) j["sender_name"] = sender_name;
        return j;
    }

    static MessageRecord from_json(const nlohmann::json& j) {
        MessageRecord m;
        m.timestamp = j.value("timestamp", "");
        m.role = j.value("role", "");
        m.content = j.value("content", "");
        m.sender_id = j.value("sender_id", "");
        m.sender_name = j.value("sender_name", "");
        return m;
    }

    // Single JSON Lines unit, without the trailing newline.
    std::string to_line() const {
        return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    bool operator==(const MessageRecord& o) const {
        return timestamp == o.timestamp && role == o.role && content == o.content &&
               sender_id == o.sender_id && sender_name == o.sender_name;
    }
};

} // namespace chatbackup
