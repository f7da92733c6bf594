#include "backup_plugin.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace chatbackup;
using namespace chatbackup::tests;

namespace {

std::vector<MessageSegment> segs(std::initializer_list<std::optional<std::string>> parts) {
    std::vector<MessageSegment> out;
    for (auto& p : parts) out.push_back(MessageSegment{p});
    return out;
}

} // namespace

int main() {
    expect_eq(extract_text(segs({"hello", std::nullopt, "world"})), std::string("hello world"), "join");
    expect_eq(extract_text(segs({"  padded ", ""})), std::string("padded"), "trim and skip empty");
    expect_eq(extract_text(segs({std::nullopt})), std::string(""), "image only");

    // Ingest events: numeric ids are accepted, other id types are rejected
    // without throwing.
    {
        std::string error;
        auto numeric = parse_host_event(
            nlohmann::json::parse(R"({"type":"message","group_id":123456,"sender_id":42,"text":"hi"})"), error);
        expect(numeric.has_value(), "numeric ids accepted");
        expect(!numeric->response, "message event");
        expect_eq(numeric->event.group_id, std::string("123456"), "numeric group id");
        expect_eq(numeric->event.sender_id, std::string("42"), "numeric sender id");
        expect_eq(extract_text(numeric->event.segments), std::string("hi"), "event text");

        auto reply = parse_host_event(
            nlohmann::json::parse(R"({"type":"response","sender_id":"7","segments":["a",null,"b"]})"), error);
        expect(reply.has_value() && reply->response, "response event");
        expect_eq(extract_text(reply->event.segments), std::string("a b"), "reply segments");

        auto defaulted = parse_host_event(nlohmann::json::parse(R"({"sender_id":"7","group_id":null})"), error);
        expect(defaulted.has_value() && !defaulted->response, "type defaults to message");
        expect(defaulted->event.group_id.empty(), "null group id is private");

        error.clear();
        expect(!parse_host_event(nlohmann::json::parse(R"({"group_id":{"id":1}})"), error), "object id rejected");
        expect_contains(error, "group_id");
        expect(!parse_host_event(nlohmann::json::parse(R"({"sender_name":1.5})"), error), "float name rejected");
        expect(!parse_host_event(nlohmann::json::parse(R"({"type":7})"), error), "non-string type rejected");
        expect(!parse_host_event(nlohmann::json::parse(R"({"type":"poke"})"), error), "unknown type rejected");
        expect(!parse_host_event(nlohmann::json::parse("[1,2]"), error), "non-object rejected");
    }

    const fs::path root = create_unique_temp_dir("chatbackup-plugin-smoke");
    Config cfg;
    cfg.data_dir = root.string();
    cfg.group_blacklist = {"blocked"};

    {
        BackupPlugin plugin(cfg);
        expect(plugin.start(), "start without viewer");
        expect(plugin.viewer() == nullptr, "viewer off");
        expect(plugin.archives() != nullptr, "archive index opened");

        ChatEvent dm;
        dm.sender_id = "555";
        dm.sender_name = "Carol";
        dm.segments = segs({"hi", "there"});
        expect(plugin.on_message(dm), "private inbound saved");
        expect(plugin.on_bot_response(dm, segs({"hello", "Carol"})), "private reply saved");

        auto lines = read_lines(root / "555_private.jsonl");
        expect_eq(lines.size(), size_t{2}, "private lines");
        auto in = nlohmann::json::parse(lines[0]);
        expect_eq(in["role"].get<std::string>(), std::string("user"), "inbound role");
        expect_eq(in["content"].get<std::string>(), std::string("hi there"), "inbound text");
        expect_eq(in["sender_name"].get<std::string>(), std::string("Carol"), "sender name");
        auto out = nlohmann::json::parse(lines[1]);
        expect_eq(out["role"].get<std::string>(), std::string("assistant"), "reply role");
        expect(!out.contains("sender_id"), "reply carries no sender");

        ChatEvent grp;
        grp.group_id = "777";
        grp.sender_id = "555";
        grp.segments = segs({"group hello"});
        expect(plugin.on_message(grp), "group inbound saved");
        auto glines = read_lines(root / "777_group.jsonl");
        expect_eq(glines.size(), size_t{1}, "group keyed by group id");
        expect_eq(nlohmann::json::parse(glines[0])["sender_id"].get<std::string>(), std::string("555"),
                  "group sender kept");

        std::string error;
        auto numeric = parse_host_event(
            nlohmann::json::parse(R"({"group_id":888,"sender_id":555,"text":"numeric ids"})"), error);
        expect(numeric && plugin.on_message(numeric->event), "numeric-id event saved");
        expect_eq(read_lines(root / "888_group.jsonl").size(), size_t{1}, "numeric group file");

        ChatEvent blocked = grp;
        blocked.group_id = "blocked";
        expect(!plugin.on_message(blocked), "blacklisted group skipped");

        ChatEvent empty = dm;
        empty.segments = segs({std::nullopt, "   "});
        expect(!plugin.on_message(empty), "no text skipped");
        expect(!plugin.on_bot_response(dm, {}), "empty reply skipped");

        ChatEvent anonymous;
        anonymous.segments = segs({"who am i"});
        expect(!plugin.on_message(anonymous), "no conversation id skipped");

        expect_eq(read_lines(root / "555_private.jsonl").size(), size_t{2}, "skips wrote nothing");
        expect(!fs::exists(root / "blocked_group.jsonl"), "no blacklisted file");
    }

    remove_path_best_effort(root);
    std::cout << "backup_plugin_smoke: ok\n";
    return 0;
}
