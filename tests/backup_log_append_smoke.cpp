#include "backup_log.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace chatbackup;
using namespace chatbackup::tests;

namespace {

MessageRecord make(const std::string& role, const std::string& content) {
    MessageRecord m;
    m.role = role;
    m.content = content;
    return m;
}

} // namespace

int main() {
    const fs::path root = create_unique_temp_dir("chatbackup-append-smoke");

    Config cfg;
    cfg.data_dir = (root / "data").string();
    cfg.max_file_size_mb = 1024;
    BackupLog log(cfg);

    // Five private messages, huge threshold: one file, five lines, in order.
    std::vector<MessageRecord> written;
    for (int i = 0; i < 5; i++) {
        MessageRecord m = make(i % 2 == 0 ? "user" : "assistant", "message " + std::to_string(i));
        if (m.role == "user") {
            m.sender_id = "10001";
            m.sender_name = "Alice";
        }
        expect(log.record("10001", ChatKind::private_chat, m), "record should succeed");
        written.push_back(m);
    }

    const fs::path current = root / "data" / "10001_private.jsonl";
    expect(fs::exists(current), "private log file missing");
    expect_eq(jsonl_files(root / "data").size(), size_t{1}, "file count");

    auto lines = read_lines(current);
    expect_eq(lines.size(), size_t{5}, "line count");
    for (size_t i = 0; i < lines.size(); i++) {
        auto j = nlohmann::json::parse(lines[i]);
        MessageRecord back = MessageRecord::from_json(j);
        expect(!back.timestamp.empty(), "timestamp should be filled in");
        expect_eq(back.role, written[i].role, "role");
        expect_eq(back.content, written[i].content, "content");
        expect_eq(back.sender_id, written[i].sender_id, "sender_id");
        expect_eq(back.sender_name, written[i].sender_name, "sender_name");
        if (written[i].sender_id.empty()) {
            expect(!j.contains("sender_id"), "absent sender_id must not be serialized");
        }
    }

    // Timestamps are ISO-8601 with a 'T' separator.
    expect_contains(nlohmann::json::parse(lines[0])["timestamp"].get<std::string>(), "T");

    // Explicit timestamp and non-ASCII content survive a round trip.
    MessageRecord fixed = make("user", "你好, world \"quoted\"\nsecond line");
    fixed.timestamp = "2024-01-15T09:30:00.000000";
    expect(log.record("g-42", ChatKind::group, fixed), "group record should succeed");
    auto group_lines = read_lines(root / "data" / "g-42_group.jsonl");
    expect_eq(group_lines.size(), size_t{1}, "group line count");
    expect(MessageRecord::from_json(nlohmann::json::parse(group_lines[0])) == fixed, "round trip");

    // Keys are made filename safe.
    expect(log.record("../evil/id", ChatKind::private_chat, make("user", "x")), "odd key still recorded");
    expect(fs::exists(root / "data" / "..%2Fevil%2Fid_private.jsonl"), "encoded file name");
    expect(!fs::exists(root / "evil"), "key must not escape the data directory");
    expect_eq(decode_key(encode_key("../evil/id")), std::string("../evil/id"), "encoding reverses");
    expect_eq(encode_key("50%"), std::string("50%25"), "percent escaped");
    expect_eq(decode_key("bad%zzescape%4"), std::string("bad%zzescape%4"), "malformed escape kept");

    // Keys that differ only in disallowed characters get their own files.
    expect(log.record("a:b", ChatKind::private_chat, make("user", "colon")), "a:b recorded");
    expect(log.record("a_b", ChatKind::private_chat, make("user", "underscore")), "a_b recorded");
    expect(log.record("a%3Ab", ChatKind::private_chat, make("user", "literal")), "a%3Ab recorded");
    expect(log.current_file("a:b", ChatKind::private_chat) != log.current_file("a_b", ChatKind::private_chat),
           "a:b and a_b use different files");
    auto colon_lines = read_lines(root / "data" / "a%3Ab_private.jsonl");
    expect_eq(colon_lines.size(), size_t{1}, "a:b file holds one record");
    expect_eq(nlohmann::json::parse(colon_lines[0])["content"].get<std::string>(), std::string("colon"),
              "a:b content");
    auto underscore_lines = read_lines(root / "data" / "a_b_private.jsonl");
    expect_eq(underscore_lines.size(), size_t{1}, "a_b file holds one record");
    expect_eq(read_lines(root / "data" / "a%253Ab_private.jsonl").size(), size_t{1}, "literal percent key");

    // Invalid input touches nothing.
    const auto before = jsonl_files(root / "data").size();
    expect(!log.record("", ChatKind::private_chat, make("user", "x")), "empty key rejected");
    expect(!log.record("20002", ChatKind::private_chat, make("system", "x")), "bad role rejected");
    expect(!log.record("20002", ChatKind::private_chat, make("user", "")), "empty content rejected");
    expect_eq(jsonl_files(root / "data").size(), before, "no files created by rejected input");

    // save_system_info = false strips sender metadata.
    Config stripped = cfg;
    stripped.data_dir = (root / "stripped").string();
    stripped.save_system_info = false;
    BackupLog quiet(stripped);
    MessageRecord with_sender = make("user", "hello");
    with_sender.sender_id = "30003";
    with_sender.sender_name = "Bob";
    expect(quiet.record("30003", ChatKind::private_chat, with_sender), "record should succeed");
    auto quiet_lines = read_lines(root / "stripped" / "30003_private.jsonl");
    expect_eq(quiet_lines.size(), size_t{1}, "stripped line count");
    auto qj = nlohmann::json::parse(quiet_lines[0]);
    expect(!qj.contains("sender_id") && !qj.contains("sender_name"), "sender info should be stripped");

    // A data directory that cannot be created reports failure instead of throwing.
    {
        std::ofstream blocker(root / "blocker");
        blocker << "not a directory";
    }
    Config broken = cfg;
    broken.data_dir = (root / "blocker" / "data").string();
    BackupLog failing(broken);
    expect(!failing.record("1", ChatKind::private_chat, make("user", "lost")), "write failure reported");

    remove_path_best_effort(root);
    std::cout << "backup_log_append_smoke: ok\n";
    return 0;
}
