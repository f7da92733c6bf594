#pragma once
#include <string>
#include <vector>

namespace chatbackup {

int cmd_init(const std::string& config_path);
int cmd_status(const std::string& config_path);
int cmd_serve(const std::string& config_path, const std::string& host, int port);

int cmd_record(const std::string& config_path, const std::vector<std::string>& args);
int cmd_ingest(const std::string& config_path);
int cmd_list(const std::string& config_path);
int cmd_show(const std::string& config_path, const std::vector<std::string>& args);
int cmd_stats(const std::string& config_path);
int cmd_archives(const std::string& config_path, const std::vector<std::string>& args);

} // namespace chatbackup
