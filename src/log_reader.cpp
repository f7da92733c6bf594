#include "log_reader.hpp"
#include "backup_log.hpp"
#include <algorithm>
#include <cmath>
#include <regex>
#include <iterator>
#include <iostream>

namespace chatbackup {

static double round_to(double v, int decimals) {
    double f = std::pow(10.0, decimals);
    return std::round(v * f) / f;
}

// Complete, non-empty lines. A trailing fragment without '\n' is a write in
// progress and is left out.
static std::vector<std::string> read_complete_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream f(path, std::ios::binary);
    if (!f) return lines;
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    size_t start = 0;
    while (true) {
        size_t nl = data.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = data.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
        start = nl + 1;
    }
    return lines;
}

static std::optional<MessageRecord> parse_line(const std::string& line) {
    try {
        auto j = nlohmann::json::parse(line);
        if (!j.is_object()) return std::nullopt;
        return MessageRecord::from_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// Records from complete lines that parse; malformed lines are skipped.
static std::vector<MessageRecord> read_records(const fs::path& path) {
    std::vector<MessageRecord> records;
    for (auto& line : read_complete_lines(path)) {
        if (auto rec = parse_line(line)) records.push_back(std::move(*rec));
    }
    return records;
}

LogName parse_log_name(const std::string& filename) {
    static const std::regex pattern(R"(^(.+)_(private|group)(_\d{8}_\d{6}(_\d+)?)?\.jsonl$)");
    LogName n;
    std::smatch m;
    if (std::regex_match(filename, m, pattern)) {
        n.chat_id = decode_key(m[1].str());
        n.kind = m[2].str();
        n.archived = m[3].matched;
        return n;
    }
    std::string stem = fs::path(filename).stem().string();
    n.chat_id = decode_key(stem);
    n.kind = "unknown";
    return n;
}

nlohmann::json LogSummary::to_json() const {
    return {
        {"filename", filename},
        {"chat_id", name.chat_id},
        {"type", name.kind},
        {"archived", name.archived},
        {"message_count", message_count},
        {"size_kb", size_kb},
        {"last_message", last_message},
        {"last_time", last_time},
    };
}

nlohmann::json LogPage::to_json() const {
    nlohmann::json msgs = nlohmann::json::array();
    for (auto& m : messages) msgs.push_back(m.to_json());
    return {
        {"messages", msgs},
        {"total", total},
        {"page", page},
        {"page_size", page_size},
    };
}

nlohmann::json LogStats::to_json() const {
    return {
        {"total_chats", total_chats},
        {"total_messages", total_messages},
        {"total_size_mb", total_size_mb},
        {"private_chats", private_chats},
        {"group_chats", group_chats},
    };
}

bool LogReader::is_safe_filename(const std::string& filename) {
    if (filename.empty()) return false;
    if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) return false;
    if (filename == "." || filename == "..") return false;
    const std::string ext = ".jsonl";
    return filename.size() > ext.size() &&
           filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

std::vector<fs::path> LogReader::log_files() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return files;
    for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        if (it->path().extension() == ".jsonl") files.push_back(it->path());
    }
    if (ec) {
        std::cerr << "[reader] Error scanning " << dir_.string() << ": " << ec.message() << "\n";
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<LogSummary> LogReader::list_logs() const {
    std::vector<LogSummary> result;
    for (auto& path : log_files()) {
        LogSummary s;
        s.filename = path.filename().string();
        s.name = parse_log_name(s.filename);

        std::error_code ec;
        auto size = fs::file_size(path, ec);
        s.size_kb = ec ? 0.0 : round_to(static_cast<double>(size) / 1024.0, 1);

        auto records = read_records(path);
        s.message_count = static_cast<int64_t>(records.size());
        if (!records.empty()) {
            s.last_message = utf8_prefix(records.back().content, 50);
            s.last_time = records.back().timestamp;
        }
        result.push_back(std::move(s));
    }
    std::stable_sort(result.begin(), result.end(), [](const LogSummary& a, const LogSummary& b) {
        return a.last_time > b.last_time;
    });
    return result;
}

std::optional<LogPage> LogReader::read_page(const std::string& filename, int page, int page_size) const {
    if (!is_safe_filename(filename)) return std::nullopt;
    fs::path path = dir_ / filename;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    LogPage p;
    p.page = std::max(page, 1);
    p.page_size = std::clamp(page_size, 1, kMaxPageSize);

    auto records = read_records(path);
    p.total = static_cast<int64_t>(records.size());

    int64_t end = p.total - static_cast<int64_t>(p.page - 1) * p.page_size;
    int64_t start = std::max<int64_t>(0, p.total - static_cast<int64_t>(p.page) * p.page_size);
    for (int64_t i = end - 1; i >= start; i--) {
        p.messages.push_back(std::move(records[static_cast<size_t>(i)]));
    }
    return p;
}

LogStats LogReader::stats() const {
    LogStats st;
    double total_bytes = 0;
    for (auto& path : log_files()) {
        st.total_chats++;
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (!ec) total_bytes += static_cast<double>(size);

        auto kind = parse_log_name(path.filename().string()).kind;
        if (kind == "private") st.private_chats++;
        else if (kind == "group") st.group_chats++;

        st.total_messages += static_cast<int64_t>(read_records(path).size());
    }
    st.total_size_mb = round_to(total_bytes / (1024.0 * 1024.0), 2);
    return st;
}

} // namespace chatbackup
