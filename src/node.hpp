#pragma once

#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "server.hpp"
#include "swarm_downloader.hpp"

class SettingsManager;

// Runs one command-line action against the settings it is given. Each action
// returns a process exit code; failures are reported through the logger.
class Node {
public:
  Node(std::shared_ptr<SettingsManager> settings, std::shared_ptr<Logger> logger = nullptr);

  // Dispatches on the "mode" setting.
  int run();

  // Serves share_dir until SIGINT/SIGTERM.
  int serve();
  int list_catalog(const std::string& address);
  int file_metadata(const std::string& address, const std::string& file_name);
  int download(const std::string& content_hash,
               const std::string& file_name,
               const std::vector<std::string>& servers);

  Server::Options server_options() const;
  SwarmConfig swarm_config() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
};
