#include "backup_log.hpp"
#include "archive_index.hpp"
#include "web_viewer.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace chatbackup;
using namespace chatbackup::tests;

namespace {

nlohmann::json get_json(httplib::Client& cli, const std::string& path, int expected_status) {
    auto res = cli.Get(path.c_str());
    if (!res) fail("no response for " + path);
    if (res->status != expected_status) {
        fail(path + ": expected status " + std::to_string(expected_status) + " got " +
             std::to_string(res->status) + " body " + res->body);
    }
    return nlohmann::json::parse(res->body);
}

} // namespace

int main() {
    const fs::path root = create_unique_temp_dir("chatbackup-webui-smoke");
    Config cfg;
    cfg.data_dir = root.string();
    ArchiveIndex index((root / "archives.db").string());
    BackupLog log(cfg, &index);

    for (int i = 0; i < 5; i++) {
        MessageRecord m;
        m.role = i % 2 == 0 ? "user" : "assistant";
        m.content = "line " + std::to_string(i);
        expect(log.record("900", ChatKind::private_chat, m), "seed record");
    }
    log.set_rotate_threshold(1);
    MessageRecord g;
    g.role = "user";
    g.content = "rotated right away";
    expect(log.record("g1", ChatKind::group, g), "rotating record");

    WebViewer viewer("127.0.0.1", 0, root.string(), &index);
    expect(viewer.start(), "viewer should start");
    expect(viewer.port() > 0, "ephemeral port bound");

    httplib::Client cli("127.0.0.1", viewer.port());
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(5, 0);

    auto health = get_json(cli, "/health", 200);
    expect_eq(health["status"].get<std::string>(), std::string("ok"), "health");

    auto page = cli.Get("/");
    expect(page && page->status == 200, "index page");
    expect_contains(page->body, "/api/chats");

    auto chats = get_json(cli, "/api/chats", 200);
    expect(chats.is_array(), "chat list is an array");
    expect_eq(chats.size(), size_t{3}, "private log, rotated group log, empty group log");

    auto chat = get_json(cli, "/api/chat/900_private.jsonl?page=1&size=2", 200);
    expect_eq(chat["total"].get<int>(), 5, "total");
    expect_eq(chat["page_size"].get<int>(), 2, "page size");
    expect_eq(chat["messages"].size(), size_t{2}, "page length");
    expect_eq(chat["messages"][0]["content"].get<std::string>(), std::string("line 4"), "newest first");

    auto missing = get_json(cli, "/api/chat/nobody_private.jsonl", 404);
    expect_eq(missing["error"].get<std::string>(), std::string("Chat not found"), "not found error");
    get_json(cli, "/api/chat/900_private.jsonl?page=abc", 400);

    auto stats = get_json(cli, "/api/stats", 200);
    expect_eq(stats["total_messages"].get<int>(), 6, "stats messages");
    expect_eq(stats["private_chats"].get<int>(), 1, "stats private");
    expect_eq(stats["group_chats"].get<int>(), 2, "stats group");

    auto archives = get_json(cli, "/api/archives?chat=g1", 200);
    expect_eq(archives.size(), size_t{1}, "one archive for g1");
    expect_eq(archives[0]["record_count"].get<int>(), 1, "archive records");

    viewer.stop();
    expect(!viewer.running(), "viewer stopped");

    remove_path_best_effort(root);
    std::cout << "web_viewer_smoke: ok\n";
    return 0;
}
