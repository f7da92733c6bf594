#include "backup_log.hpp"
#include "conversation_filter.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <iostream>

namespace fs = std::filesystem;
using namespace chatbackup;
using namespace chatbackup::tests;

namespace {

MessageRecord hello() {
    MessageRecord m;
    m.role = "user";
    m.content = "hello";
    return m;
}

} // namespace

int main() {
    {
        Config cfg;
        ConversationFilter all(cfg);
        expect(all.allows("1", ChatKind::private_chat), "private allowed by default");
        expect(all.allows("g1", ChatKind::group), "group allowed by default");
    }
    {
        Config cfg;
        cfg.enable_private = false;
        ConversationFilter f(cfg);
        expect(!f.allows("1", ChatKind::private_chat), "private disabled");
        expect(f.allows("g1", ChatKind::group), "group unaffected");
    }
    {
        Config cfg;
        cfg.enable_group = false;
        cfg.group_whitelist = {"g1"};
        ConversationFilter f(cfg);
        expect(!f.allows("g1", ChatKind::group), "group disabled wins over whitelist");
        expect(f.allows("1", ChatKind::private_chat), "private unaffected");
    }
    {
        Config cfg;
        cfg.group_whitelist = {"g1", "g2"};
        cfg.group_blacklist = {"g2"};
        ConversationFilter f(cfg);
        expect(f.allows("g1", ChatKind::group), "whitelisted group");
        expect(!f.allows("g2", ChatKind::group), "blacklist applies inside whitelist");
        expect(!f.allows("g3", ChatKind::group), "group outside whitelist");
        expect(f.allows("g3", ChatKind::private_chat), "lists do not apply to private chats");
    }

    // Filtered messages produce zero writes.
    const fs::path root = create_unique_temp_dir("chatbackup-filter-smoke");
    Config cfg;
    cfg.data_dir = root.string();
    cfg.enable_private = false;
    cfg.group_whitelist = {"g1", "g2"};
    cfg.group_blacklist = {"g2"};
    BackupLog log(cfg);

    expect(!log.record("100", ChatKind::private_chat, hello()), "private filtered");
    expect(!log.record("g2", ChatKind::group, hello()), "blacklisted filtered");
    expect(!log.record("g9", ChatKind::group, hello()), "non-whitelisted filtered");
    expect(jsonl_files(root).empty(), "filtered messages must not create files");

    expect(log.record("g1", ChatKind::group, hello()), "whitelisted group recorded");
    expect_eq(jsonl_files(root).size(), size_t{1}, "one file after accepted write");
    expect_eq(read_lines(root / "g1_group.jsonl").size(), size_t{1}, "one line");

    remove_path_best_effort(root);
    std::cout << "conversation_filter_smoke: ok\n";
    return 0;
}
