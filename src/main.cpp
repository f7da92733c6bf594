#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: chatbackup [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Write a default config\n"
              << "  status                      Show configuration and backup totals\n"
              << "  record --chat ID [--group] --role user|assistant --content TEXT\n"
              << "         [--sender-id ID] [--sender-name NAME]\n"
              << "                              Append one message\n"
              << "  ingest                      Back up JSON message events read from stdin\n"
              << "  serve [--host H] [--port P] Run the web viewer\n"
              << "  list                        List log files\n"
              << "  show FILE [--page N] [--size N]\n"
              << "                              Print records, newest first\n"
              << "  stats                       Print totals as JSON\n"
              << "  archives [--chat ID]        List rotated files\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = chatbackup::default_config_path();
    std::vector<std::string> rest;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            rest.push_back(a);
        }
    }

    if (rest.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = rest[0];
    std::vector<std::string> args(rest.begin() + 1, rest.end());

    if (cmd == "init") {
        return chatbackup::cmd_init(config_path);
    }
    else if (cmd == "status") {
        return chatbackup::cmd_status(config_path);
    }
    else if (cmd == "record") {
        return chatbackup::cmd_record(config_path, args);
    }
    else if (cmd == "ingest") {
        return chatbackup::cmd_ingest(config_path);
    }
    else if (cmd == "serve") {
        std::string host;
        int port = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
                if (port < 1 || port > 65535) {
                    std::cerr << "Port out of range: " << port << "\n";
                    return 1;
                }
            }
        }
        return chatbackup::cmd_serve(config_path, host, port);
    }
    else if (cmd == "list") {
        return chatbackup::cmd_list(config_path);
    }
    else if (cmd == "show") {
        return chatbackup::cmd_show(config_path, args);
    }
    else if (cmd == "stats") {
        return chatbackup::cmd_stats(config_path);
    }
    else if (cmd == "archives") {
        return chatbackup::cmd_archives(config_path, args);
    }
    else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
