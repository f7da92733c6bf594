#include "conversation_filter.hpp"
#include <algorithm>

namespace chatbackup {

static bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool ConversationFilter::allows(const std::string& conversation_key, ChatKind kind) const {
    if (kind == ChatKind::private_chat) return enable_private_;

    if (!enable_group_) return false;
    if (!whitelist_.empty() && !contains(whitelist_, conversation_key)) return false;
    if (contains(blacklist_, conversation_key)) return false;
    return true;
}

} // namespace chatbackup
