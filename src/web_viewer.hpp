#pragma once
#include "log_reader.hpp"
#include <httplib.h>
#include <string>
#include <thread>
#include <atomic>

namespace chatbackup {

class ArchiveIndex;

// Read-only HTTP view of the backup directory:
//   GET /                       viewer page
//   GET /health
//   GET /api/chats              log summaries, newest first
//   GET /api/chat/{file}        ?page=N&size=M, newest records first
//   GET /api/stats
//   GET /api/archives           ?chat=ID, rotation catalog
class WebViewer {
public:
    // port 0 binds an ephemeral port; see port() after start().
    WebViewer(const std::string& host, int port, const std::string& data_dir,
              ArchiveIndex* archives = nullptr);
    ~WebViewer();

    WebViewer(const WebViewer&) = delete;
    WebViewer& operator=(const WebViewer&) = delete;

    bool start();
    void stop();

    int port() const { return port_; }
    bool running() const { return running_; }

private:
    std::string host_;
    int port_;
    LogReader reader_;
    ArchiveIndex* archives_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
};

} // namespace chatbackup
