#pragma once
#include "config.hpp"
#include "message.hpp"
#include <string>

namespace chatbackup {

// Decides whether a conversation is backed up at all. Whitelist and
// blacklist only apply to group conversations.
class ConversationFilter {
public:
    explicit ConversationFilter(const Config& cfg)
        : enable_private_(cfg.enable_private)
        , enable_group_(cfg.enable_group)
        , whitelist_(cfg.group_whitelist)
        , blacklist_(cfg.group_blacklist) {}

    bool allows(const std::string& conversation_key, ChatKind kind) const;

private:
    bool enable_private_;
    bool enable_group_;
    std::vector<std::string> whitelist_;
    std::vector<std::string> blacklist_;
};

} // namespace chatbackup
