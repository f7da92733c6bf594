#include "commands.hpp"
#include "config.hpp"
#include "archive_index.hpp"
#include "web_viewer.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

namespace chatbackup {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& config_path, const std::string& host, int port) {
    Config cfg = Config::load(config_path);
    std::string dir = cfg.data_path();

    std::unique_ptr<ArchiveIndex> archives;
    try {
        archives = std::make_unique<ArchiveIndex>(dir + "/archives.db");
    } catch (const std::exception& e) {
        std::cerr << "[serve] Archive index unavailable: " << e.what() << "\n";
    }

    WebViewer viewer(host.empty() ? cfg.webui_host : host,
                     port > 0 ? port : cfg.webui_port,
                     dir, archives.get());
    if (!viewer.start()) {
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cerr << "[serve] Ready. Ctrl+C to quit.\n";

    while (g_running && viewer.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[serve] Shutting down...\n";
    viewer.stop();
    return 0;
}

} // namespace chatbackup
