#include "node.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>

#include "errors.hpp"
#include "peer_client.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

// Whole-percent steps only, so large files do not flood the console.
SwarmProgressCallback make_console_progress(std::shared_ptr<Logger> logger) {
  auto last_percent = std::make_shared<std::atomic<int>>(-1);
  return [logger, last_percent](std::size_t completed, std::size_t total, uint64_t bytes) {
    int percent = total == 0 ? 100 : static_cast<int>(completed * 100 / total);
    int previous = last_percent->load();
    do {
      if(percent <= previous) return;
    } while(!last_percent->compare_exchange_weak(previous, percent));
    logger->print("  {:3}%  {}/{} chunks, {} bytes", percent, completed, total, bytes);
  };
}

} // namespace

Node::Node(std::shared_ptr<SettingsManager> settings, std::shared_ptr<Logger> logger)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("node")) {}

Server::Options Node::server_options() const {
  Server::Options options;
  options.listen_ip = settings_->get<std::string>("listen_ip");
  options.listen_port = static_cast<unsigned short>(std::clamp(settings_->get<int>("listen_port"), 0, 65535));
  options.io_threads = static_cast<std::size_t>(std::max(settings_->get<int>("io_threads"), 1));
  options.share_dir = settings_->get<std::string>("share_dir");
  options.chunk_dir = settings_->get<std::string>("chunk_dir");
  return options;
}

SwarmConfig Node::swarm_config() const {
  SwarmConfig config;
  config.workers = static_cast<std::size_t>(std::clamp(settings_->get<int>("workers"), 1, 64));
  config.output_dir = settings_->get<std::string>("download_dir");
  config.chunk_dir = config.output_dir / ".chunks";
  config.logger = logger_->child("swarm");
  return config;
}

int Node::run() {
  const std::string mode = settings_->get<std::string>("mode");
  const auto servers = split_list(settings_->get<std::string>("servers"));

  if(mode == "serve") {
    return serve();
  }
  if(servers.empty()) {
    logger_->print_err("Mode '{}' needs at least one server address", mode);
    return 2;
  }
  if(mode == "catalog") {
    return list_catalog(servers.front());
  }
  if(mode == "metadata") {
    return file_metadata(servers.front(), settings_->get<std::string>("file_name"));
  }
  if(mode == "download") {
    return download(settings_->get<std::string>("hash"),
                    settings_->get<std::string>("file_name"),
                    servers);
  }
  logger_->print_err("Unknown mode '{}'", mode);
  return 2;
}

int Node::serve() {
  Server server(server_options(), logger_->child("server"));
  server.start();
  server.start_background();
  logger_->print("Listening on {}:{} (Ctrl-C to stop)",
                 settings_->get<std::string>("listen_ip"), server.listen_port());

  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([this](const std::error_code& ec, int signal_number) {
    if(!ec) {
      logger_->info("Received signal {}, shutting down", signal_number);
    }
  });
  signal_io.run();

  server.stop();
  return 0;
}

int Node::list_catalog(const std::string& address) {
  Catalog catalog;
  try {
    catalog = fetch_catalog(address, logger_->child("client"));
  } catch(const TransferError& e) {
    logger_->print_err("Catalog request to {} failed ({}): {}", address, error_kind_name(e.kind()), e.what());
    return 1;
  }

  logger_->print("{} file(s) on {}", catalog.files.size(), address);
  for(const auto& file : catalog.files) {
    logger_->print("  {}  {:>12}  {:>5} chunk(s)  {}",
                   file.hash, file.size, file.chunks.size(), file.name);
  }
  return 0;
}

int Node::file_metadata(const std::string& address, const std::string& file_name) {
  FileMetadataResponse metadata;
  try {
    PeerClient client(logger_->child("client"));
    client.connect(address);
    metadata = client.fetch_file_metadata(file_name);
  } catch(const TransferError& e) {
    logger_->print_err("Metadata request to {} failed ({}): {}", address, error_kind_name(e.kind()), e.what());
    return 1;
  }

  if(metadata.chunks.empty()) {
    logger_->print_err("{} has no file named '{}'", address, file_name);
    return 1;
  }
  logger_->print("{}  {}", metadata.hash, metadata.file_name);
  for(const auto& chunk : metadata.chunks) {
    logger_->print("  {}", chunk);
  }
  return 0;
}

int Node::download(const std::string& content_hash,
                   const std::string& file_name,
                   const std::vector<std::string>& servers) {
  SwarmConfig config = swarm_config();
  config.progress = make_console_progress(logger_);

  SwarmResult result;
  if(!run_swarm_download(content_hash, file_name, servers, config, result)) {
    logger_->print_err("Download of {} failed ({}): {}",
                       content_hash, error_kind_name(result.error), result.failure_reason);
    return 1;
  }
  logger_->print("Saved {} ({} chunk(s))", result.output_path.string(), result.total_chunks);
  return 0;
}
